// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace Reclaim {

/**
 * Settings from the user's Reclaim account.  They fill gaps in the
 * caller's task fields but never override them.
 */
struct AccountDefaults {
	/**
	 * The account's IANA time zone (may be empty).
	 */
	std::string time_zone;

	std::optional<std::string> category, sub_type, priority;
	std::optional<std::string> time_scheme_id;

	std::optional<unsigned> time_chunks_required;
	std::optional<unsigned> min_chunk_size, max_chunk_size;

	/**
	 * The default due date is this many days after the task
	 * creation.
	 */
	std::optional<unsigned> due_in_days;

	std::optional<bool> always_private, on_deck;

	/**
	 * The task defaults object as received from the API.
	 */
	nlohmann::json raw = nlohmann::json::object();

	/**
	 * Extract the defaults from the response of the "current user"
	 * endpoint.  Missing or malformed members are ignored.
	 */
	static AccountDefaults FromUser(const nlohmann::json &user);

	/**
	 * Describe the defaults in a JSON object for the
	 * reclaim_get_task_defaults tool.
	 */
	nlohmann::json ToJson() const;
};

} // namespace Reclaim
