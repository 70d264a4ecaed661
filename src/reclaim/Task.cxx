// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Task.hxx"
#include "Error.hxx"

#include <fmt/format.h>

#include <limits>

namespace Reclaim {

using json = nlohmann::json;

/**
 * Find a member which is present and not null.
 */
static const json *
FindMember(const json &j, std::string_view key) noexcept
{
	const auto i = j.find(key);
	return i != j.end() && !i->is_null() ? &*i : nullptr;
}

static std::optional<std::string>
GetOptionalString(const json &j, std::string_view key)
{
	const auto *m = FindMember(j, key);
	if (m == nullptr)
		return std::nullopt;

	if (!m->is_string())
		throw InvalidInput(fmt::format("{} must be a string", key));

	return m->get<std::string>();
}

static std::optional<bool>
GetOptionalBool(const json &j, std::string_view key)
{
	const auto *m = FindMember(j, key);
	if (m == nullptr)
		return std::nullopt;

	if (!m->is_boolean())
		throw InvalidInput(fmt::format("{} must be a boolean", key));

	return m->get<bool>();
}

static std::optional<unsigned>
GetOptionalPositive(const json &j, std::string_view key)
{
	const auto *m = FindMember(j, key);
	if (m == nullptr)
		return std::nullopt;

	if (m->is_number_integer()) {
		const auto value = m->get<int64_t>();
		if (value > 0 && value <= std::numeric_limits<unsigned>::max())
			return static_cast<unsigned>(value);
	}

	throw InvalidInput(fmt::format("{} must be a positive integer", key));
}

static std::optional<TimeExpression>
GetOptionalTime(const json &j, std::string_view key)
{
	const auto *m = FindMember(j, key);
	if (m == nullptr)
		return std::nullopt;

	if (m->is_string())
		return TimeExpression{m->get<std::string>()};

	if (m->is_number_unsigned()) {
		const auto value = m->get<unsigned long long>();
		return TimeExpression{RelativeDays{value <= (unsigned long long)std::numeric_limits<long>::max()
				? static_cast<long>(value)
				: std::numeric_limits<long>::max()}};
	}

	if (m->is_number_integer())
		return TimeExpression{RelativeDays{m->get<long>()}};

	throw InvalidInput(fmt::format("{} must be a number of days or a date/time string",
				       key));
}

TaskInput
TaskInput::FromJson(const json &args)
{
	if (!args.is_object())
		throw InvalidInput("Arguments must be an object");

	TaskInput input;
	input.title = GetOptionalString(args, "title");
	input.notes = GetOptionalString(args, "notes");
	input.category = GetOptionalString(args, "eventCategory");
	input.sub_type = GetOptionalString(args, "eventSubType");
	input.priority = GetOptionalString(args, "priority");
	input.color = GetOptionalString(args, "eventColor");
	input.status = GetOptionalString(args, "status");

	input.time_chunks_required = GetOptionalPositive(args, "timeChunksRequired");
	input.min_chunk_size = GetOptionalPositive(args, "minChunkSize");
	input.max_chunk_size = GetOptionalPositive(args, "maxChunkSize");
	input.duration_minutes = GetOptionalPositive(args, "durationMinutes");
	input.min_duration_minutes = GetOptionalPositive(args, "minDurationMinutes");
	input.max_duration_minutes = GetOptionalPositive(args, "maxDurationMinutes");

	input.lock_chunk_size_to_duration =
		GetOptionalBool(args, "lockChunkSizeToDuration").value_or(false);
	input.on_deck = GetOptionalBool(args, "onDeck");
	input.always_private = GetOptionalBool(args, "alwaysPrivate");

	input.time_scheme_id = GetOptionalString(args, "timeSchemeId");

	input.deadline = GetOptionalTime(args, "deadline");
	input.snooze_until = GetOptionalTime(args, "snoozeUntil");
	input.due = GetOptionalString(args, "due");
	input.start_time = GetOptionalString(args, "startTime");

	if (auto tz = GetOptionalString(args, "timeZone"))
		input.time_zone = std::move(*tz);
	else if (auto alias = GetOptionalString(args, "timezone"))
		input.time_zone = std::move(*alias);

	return input;
}

bool
NormalizedTask::IsEmpty() const noexcept
{
	return !title && !notes && !category && !sub_type && !priority &&
		!color && !status &&
		!time_chunks_required && !min_chunk_size && !max_chunk_size &&
		!on_deck && !always_private && !time_scheme_id &&
		!due && !snooze_until;
}

template<typename T>
static void
SetOptional(json &j, const char *key, const std::optional<T> &value)
{
	if (value)
		j[key] = *value;
}

json
NormalizedTask::ToJson() const
{
	json j = json::object();
	SetOptional(j, "title", title);
	SetOptional(j, "notes", notes);
	SetOptional(j, "eventCategory", category);
	SetOptional(j, "eventSubType", sub_type);
	SetOptional(j, "priority", priority);
	SetOptional(j, "timeChunksRequired", time_chunks_required);
	SetOptional(j, "minChunkSize", min_chunk_size);
	SetOptional(j, "maxChunkSize", max_chunk_size);
	SetOptional(j, "onDeck", on_deck);
	SetOptional(j, "alwaysPrivate", always_private);
	SetOptional(j, "timeSchemeId", time_scheme_id);
	SetOptional(j, "status", status);
	SetOptional(j, "due", due);
	SetOptional(j, "snoozeUntil", snooze_until);
	SetOptional(j, "eventColor", color);
	return j;
}

} // namespace Reclaim
