// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "co/Task.hxx"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace Reclaim {

using TaskId = uint_least64_t;

/**
 * Actions on a task which are triggered by a POST to
 * "/planner/ACTION/task/ID" without parameters.
 */
enum class PlannerAction {
	DONE,
	UNARCHIVE,
	START,
	STOP,
	CLEAR_EXCEPTIONS,
	PRIORITIZE,
};

[[gnu::const]]
const char *
ToString(PlannerAction action) noexcept;

/**
 * The Reclaim task API.  All methods throw #ApiError if the service
 * rejects the request and other exceptions on transport errors.
 * Responses without a body are returned as {"success":true}.
 */
class RecordService {
public:
	virtual ~RecordService() noexcept = default;

	/**
	 * @return a JSON array of task objects
	 */
	virtual Co::Task<nlohmann::json> ListTasks() = 0;

	virtual Co::Task<nlohmann::json> GetTask(TaskId id) = 0;

	virtual Co::Task<nlohmann::json> CreateTask(nlohmann::json body) = 0;

	/**
	 * Create a task and place it at the given time.
	 *
	 * @param start_time an ISO 8601 UTC time
	 */
	virtual Co::Task<nlohmann::json> CreateTaskAtTime(std::string start_time,
							  nlohmann::json body) = 0;

	virtual Co::Task<nlohmann::json> UpdateTask(TaskId id,
						    nlohmann::json body) = 0;

	virtual Co::Task<void> DeleteTask(TaskId id) = 0;

	virtual Co::Task<nlohmann::json> Plan(PlannerAction action, TaskId id) = 0;

	virtual Co::Task<nlohmann::json> AddTime(TaskId id, unsigned minutes) = 0;

	/**
	 * @param end an ISO 8601 UTC time or std::nullopt for "now"
	 */
	virtual Co::Task<nlohmann::json> LogWork(TaskId id, unsigned minutes,
						 std::optional<std::string> end) = 0;
};

/**
 * Provides information about the account the API key belongs to.
 */
class AccountInfoSource {
public:
	virtual ~AccountInfoSource() noexcept = default;

	/**
	 * Fetch the current user object, which contains the time zone
	 * and the task defaults.
	 */
	virtual Co::Task<nlohmann::json> FetchCurrentUser() = 0;
};

} // namespace Reclaim
