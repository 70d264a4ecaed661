// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Normalizer.hxx"
#include "AccountDefaults.hxx"
#include "Chunks.hxx"
#include "Enums.hxx"
#include "Error.hxx"
#include "Resolver.hxx"
#include "time/ISO8601.hxx"
#include "io/Logger.hxx"
#include "util/StringStrip.hxx"

#include <fmt/format.h>

#include <algorithm>

namespace Reclaim {

static constexpr std::string_view log_domain = "normalize";

/**
 * The chunk fields after minute conversion, before defaults.
 */
struct ChunkFields {
	std::optional<unsigned> total, min, max;
};

static ChunkFields
ConvertChunks(const TaskInput &input)
{
	ChunkFields c{input.time_chunks_required,
		      input.min_chunk_size, input.max_chunk_size};

	/* minute fields win over chunk fields for the same quantity */
	if (input.duration_minutes)
		c.total = MinutesToChunks(*input.duration_minutes,
					  "durationMinutes");

	if (input.min_duration_minutes)
		c.min = MinutesToChunks(*input.min_duration_minutes,
					"minDurationMinutes");

	if (input.max_duration_minutes)
		c.max = MinutesToChunks(*input.max_duration_minutes,
					"maxDurationMinutes");

	if (input.lock_chunk_size_to_duration) {
		if (!c.total)
			throw InvalidInput("lockChunkSizeToDuration requires timeChunksRequired or durationMinutes.");

		c.min = c.max = c.total;
	} else if (c.min && c.max && *c.min > *c.max)
		throw ChunkSizeConflict(fmt::format("minChunkSize ({}) cannot be greater than maxChunkSize ({}).",
						    *c.min, *c.max));

	return c;
}

/**
 * Cap both bounds to the total; if the minimum still exceeds the
 * maximum, widen the maximum.
 */
static void
ClampChunks(std::optional<unsigned> total,
	    std::optional<unsigned> &min, std::optional<unsigned> &max) noexcept
{
	if (total) {
		if (min && *min > *total)
			min = total;
		if (max && *max > *total)
			max = total;
	}

	if (min && max && *min > *max)
		max = min;
}

static std::string
CanonicalCategory(std::string_view value,
		  const std::optional<std::string> &sub_type)
{
	if (const auto c = Lookup(category_table, value))
		return std::string{*c};

	std::string_view fallback = "WORK";
	if (sub_type)
		if (const auto s = Lookup(sub_type_table, *sub_type))
			fallback = InferCategory(*s);

	LogFmt(2, log_domain, "Unknown eventCategory \"{}\", using {}",
	       value, fallback);
	return std::string{fallback};
}

static std::string
CanonicalSubType(std::string_view value, std::string_view category)
{
	if (const auto s = Lookup(sub_type_table, value))
		return std::string{*s};

	const auto fallback = DefaultSubType(category);
	LogFmt(2, log_domain, "Unknown eventSubType \"{}\", using {}",
	       value, fallback);
	return std::string{fallback};
}

static std::string
CanonicalPriority(std::string_view value)
{
	if (const auto p = Lookup(priority_table, value))
		return std::string{*p};

	LogFmt(2, log_domain, "Unknown priority \"{}\", using P3", value);
	return "P3";
}

static std::optional<std::string>
CanonicalColor(std::string_view value)
{
	if (const auto c = Lookup(color_table, value))
		return std::string{*c};

	LogFmt(2, log_domain, "Unknown eventColor \"{}\", omitting it", value);
	return std::nullopt;
}

static std::string
CanonicalStatus(std::string_view value)
{
	if (const auto s = Lookup(status_table, value))
		return std::string{*s};

	throw InvalidInput(fmt::format("Invalid status \"{}\"; expected one of NEW, SCHEDULED, IN_PROGRESS, COMPLETE, CANCELLED, ARCHIVED",
				       value));
}

static void
NormalizeEnums(const TaskInput &input, NormalizedTask &task)
{
	if (input.category)
		task.category = CanonicalCategory(*input.category,
						  input.sub_type);

	if (input.sub_type)
		task.sub_type = CanonicalSubType(*input.sub_type,
						 task.category.value_or("WORK"));

	if (input.priority)
		task.priority = CanonicalPriority(*input.priority);

	if (input.color)
		task.color = CanonicalColor(*input.color);

	if (input.status)
		task.status = CanonicalStatus(*input.status);
}

static void
ApplyDefaults(NormalizedTask &task, const AccountDefaults &defaults,
	      const ChunkFields &c)
{
	if (!task.category) {
		if (task.sub_type)
			task.category = std::string{InferCategory(*task.sub_type)};
		else
			task.category = defaults.category;
	}

	if (!task.sub_type)
		task.sub_type = defaults.sub_type;

	if (!task.priority)
		task.priority = defaults.priority;

	if (!task.on_deck)
		task.on_deck = defaults.on_deck;

	if (!task.always_private)
		task.always_private = defaults.always_private;

	if (!task.time_scheme_id)
		task.time_scheme_id = defaults.time_scheme_id;

	if (c.total)
		task.time_chunks_required = c.total;
	else if (defaults.time_chunks_required)
		task.time_chunks_required = defaults.time_chunks_required;
	else if (c.min || c.max)
		task.time_chunks_required = std::max(c.min.value_or(0),
						     c.max.value_or(0));
	else
		task.time_chunks_required = 1;

	task.min_chunk_size = c.min ? c.min : defaults.min_chunk_size;
	if (!task.min_chunk_size)
		task.min_chunk_size = 1;

	task.max_chunk_size = c.max ? c.max : defaults.max_chunk_size;
	if (!task.max_chunk_size)
		task.max_chunk_size = task.time_chunks_required;
}

static std::chrono::system_clock::time_point
DefaultDue(std::chrono::system_clock::time_point base,
	   const AccountDefaults &defaults) noexcept
{
	return base + std::chrono::hours(24) * defaults.due_in_days.value_or(1);
}

NormalizedTask
Normalize(const TaskInput &input, const AccountDefaults &defaults,
	  const ResolutionContext &context, TaskFlow flow)
{
	const bool create = flow != TaskFlow::UPDATE;

	NormalizedTask task;

	if (input.title) {
		if (Strip(std::string_view{*input.title}).empty())
			throw InvalidInput("Title cannot be empty.");

		task.title = input.title;
	} else if (create)
		throw InvalidInput("title is required");

	task.notes = input.notes;
	task.on_deck = input.on_deck;
	task.always_private = input.always_private;
	task.time_scheme_id = input.time_scheme_id;

	const ChunkFields c = ConvertChunks(input);

	NormalizeEnums(input, task);

	if (create) {
		ApplyDefaults(task, defaults, c);
	} else {
		task.time_chunks_required = c.total;
		task.min_chunk_size = c.min;
		task.max_chunk_size = c.max;
	}

	ClampChunks(task.time_chunks_required,
		    task.min_chunk_size, task.max_chunk_size);

	/* date fields */

	std::optional<std::chrono::system_clock::time_point> start;
	if (flow == TaskFlow::CREATE_AT_TIME) {
		if (!input.start_time)
			throw InvalidInput("startTime is required");

		start = Resolve(*input.start_time, context);
		task.start_time = FormatISO8601(*start);
	}

	if (input.deadline)
		task.due = ResolveToString(*input.deadline, context);
	else if (input.due)
		task.due = ResolveToString(*input.due, context);
	else if (start) {
		/* the caller's (or the account's) total duration
		   determines the due date; the derived single-chunk
		   fallback is not used for this */
		const auto known_total = c.total
			? c.total
			: defaults.time_chunks_required;
		if (known_total)
			task.due = FormatISO8601(*start + ChunksToDuration(*known_total));
		else
			task.due = FormatISO8601(DefaultDue(*start, defaults));
	} else if (create)
		task.due = FormatISO8601(DefaultDue(context.now, defaults));

	if (input.snooze_until)
		task.snooze_until = ResolveToString(*input.snooze_until, context);

	if (!create && task.IsEmpty())
		throw InvalidInput("Update requires at least one field to change besides taskId.");

	return task;
}

} // namespace Reclaim
