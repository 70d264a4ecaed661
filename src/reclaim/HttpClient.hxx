// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "RecordService.hxx"

#include <chrono>
#include <string>
#include <string_view>

namespace Reclaim {

/**
 * Implementation of #RecordService and #AccountInfoSource which talks
 * to the Reclaim REST API with libCURL.  Requests are performed
 * synchronously; the returned tasks are complete when they are
 * first resumed.
 */
class HttpClient final : public RecordService, public AccountInfoSource {
	/**
	 * The API base URL, always ending with a slash.
	 */
	const std::string base_url;

	const std::string authorization_header;

	const std::chrono::duration<long> connect_timeout;

public:
	HttpClient(std::string_view _base_url, std::string_view api_key,
		   std::chrono::duration<long> _connect_timeout=std::chrono::seconds{10});

	/* virtual methods from class RecordService */
	Co::Task<nlohmann::json> ListTasks() override;
	Co::Task<nlohmann::json> GetTask(TaskId id) override;
	Co::Task<nlohmann::json> CreateTask(nlohmann::json body) override;
	Co::Task<nlohmann::json> CreateTaskAtTime(std::string start_time,
						  nlohmann::json body) override;
	Co::Task<nlohmann::json> UpdateTask(TaskId id,
					    nlohmann::json body) override;
	Co::Task<void> DeleteTask(TaskId id) override;
	Co::Task<nlohmann::json> Plan(PlannerAction action, TaskId id) override;
	Co::Task<nlohmann::json> AddTime(TaskId id, unsigned minutes) override;
	Co::Task<nlohmann::json> LogWork(TaskId id, unsigned minutes,
					 std::optional<std::string> end) override;

	/* virtual methods from class AccountInfoSource */
	Co::Task<nlohmann::json> FetchCurrentUser() override;

private:
	/**
	 * Send a request and parse the response body.
	 *
	 * @param path the path relative to the base URL (including
	 * the query string)
	 * @param body the request body or nullptr
	 * @param context a description of the operation for error
	 * messages
	 */
	nlohmann::json Request(const char *method, std::string_view path,
			       const nlohmann::json *body,
			       std::string_view context);
};

/**
 * Build the message of an #ApiError from the response body: its
 * "message" or "title" member or a generic text.
 */
std::string
MakeApiErrorMessage(std::string_view context, unsigned status,
		    const nlohmann::json &detail);

} // namespace Reclaim
