// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Resolver.hxx"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace Reclaim {

/**
 * The task fields as supplied by the caller, before normalization.
 * Durations may be given in chunks or in minutes; date fields are
 * unresolved expressions.
 */
struct TaskInput {
	std::optional<std::string> title, notes;

	std::optional<std::string> category, sub_type, priority;
	std::optional<std::string> color, status;

	std::optional<unsigned> time_chunks_required;
	std::optional<unsigned> min_chunk_size, max_chunk_size;

	std::optional<unsigned> duration_minutes;
	std::optional<unsigned> min_duration_minutes, max_duration_minutes;

	/**
	 * Force min and max chunk size to the total ("do not split").
	 */
	bool lock_chunk_size_to_duration = false;

	std::optional<bool> on_deck, always_private;

	std::optional<std::string> time_scheme_id;

	std::optional<TimeExpression> deadline, snooze_until;

	/**
	 * An explicit due date; "deadline" supersedes it.
	 */
	std::optional<std::string> due;

	/**
	 * Place the new task at this time (create flow only).
	 */
	std::optional<std::string> start_time;

	/**
	 * The time zone for date fields without an offset ("timeZone"
	 * or its alias "timezone").
	 */
	std::string time_zone;

	/**
	 * Parse the tool arguments.  Unknown members are ignored; a
	 * member with the wrong type throws #InvalidInput.
	 */
	static TaskInput FromJson(const nlohmann::json &args);
};

/**
 * The task fields in the form expected by the Reclaim API.  Only
 * fields which are set are sent.
 */
struct NormalizedTask {
	std::optional<std::string> title, notes;
	std::optional<std::string> category, sub_type, priority;
	std::optional<std::string> color, status;

	std::optional<unsigned> time_chunks_required;
	std::optional<unsigned> min_chunk_size, max_chunk_size;

	std::optional<bool> on_deck, always_private;
	std::optional<std::string> time_scheme_id;

	/**
	 * ISO 8601 strings with milliseconds.
	 */
	std::optional<std::string> due, snooze_until;

	/**
	 * The resolved start time; it is not part of the JSON body but
	 * a query parameter.
	 */
	std::optional<std::string> start_time;

	[[gnu::pure]]
	bool IsEmpty() const noexcept;

	nlohmann::json ToJson() const;
};

} // namespace Reclaim
