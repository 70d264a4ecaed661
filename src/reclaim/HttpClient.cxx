// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HttpClient.hxx"
#include "Error.hxx"
#include "lib/curl/Easy.hxx"
#include "lib/curl/Escape.hxx"
#include "lib/curl/Setup.hxx"
#include "lib/curl/Slist.hxx"
#include "lib/curl/StringGlue.hxx"
#include "lib/nlohmann_json/String.hxx"
#include "http/Status.hxx"
#include "io/Logger.hxx"

#include <fmt/format.h>

#include <string.h>

namespace Reclaim {

using json = nlohmann::json;

static constexpr std::string_view log_domain = "reclaim";

const char *
ToString(PlannerAction action) noexcept
{
	switch (action) {
	case PlannerAction::DONE:
		return "done";

	case PlannerAction::UNARCHIVE:
		return "unarchive";

	case PlannerAction::START:
		return "start";

	case PlannerAction::STOP:
		return "stop";

	case PlannerAction::CLEAR_EXCEPTIONS:
		return "clear-exceptions";

	case PlannerAction::PRIORITIZE:
		return "prioritize";
	}

	return "?";
}

static std::string
MakeBaseUrl(std::string_view url)
{
	std::string result{url};
	if (result.empty() || result.back() != '/')
		result.push_back('/');
	return result;
}

HttpClient::HttpClient(std::string_view _base_url, std::string_view api_key,
		       std::chrono::duration<long> _connect_timeout)
	:base_url(MakeBaseUrl(_base_url)),
	 authorization_header(fmt::format("Authorization: Bearer {}", api_key)),
	 connect_timeout(_connect_timeout)
{
}

std::string
MakeApiErrorMessage(std::string_view context, unsigned status,
		    const json &detail)
{
	std::string_view message = Json::GetStringRobust(detail, "message");
	if (message.empty())
		message = Json::GetStringRobust(detail, "title");

	if (message.empty())
		return fmt::format("API Call Failed ({}): Request failed with status code {}",
				   context, status);

	return fmt::format("API Call Failed ({}): {}", context, message);
}

json
HttpClient::Request(const char *method, std::string_view path,
		    const json *body, std::string_view context)
{
	const std::string url = base_url + std::string{path};
	LogFmt(3, log_domain, "{} {}", method, url);

	CurlSlist headers;
	headers.Append(authorization_header.c_str());
	headers.Append("Content-Type: application/json");
	headers.Append("Accept: application/json");

	CurlEasy easy{url.c_str()};
	Curl::Setup(easy, connect_timeout);
	easy.SetRequestHeaders(headers.Get());

	std::string request_body;
	if (body != nullptr)
		request_body = body->dump();

	if (strcmp(method, "POST") == 0) {
		easy.SetPost();
		easy.SetRequestBody(request_body.data(), request_body.size());
	} else if (strcmp(method, "GET") != 0) {
		easy.SetCustomRequest(method);
		if (body != nullptr)
			easy.SetRequestBody(request_body.data(),
					    request_body.size());
	}

	StringCurlResponse response;
	try {
		response = StringCurlRequest(std::move(easy));
	} catch (...) {
		LogFmt(1, log_domain, "Error during Reclaim API call ({})",
		       context);
		std::throw_with_nested(std::runtime_error(fmt::format("API Call Failed ({})",
								      context)));
	}

	const unsigned status = static_cast<unsigned>(response.status);

	if (!HttpStatusIsSuccess(response.status)) {
		json detail = json::parse(response.body, nullptr, false);
		if (detail.is_discarded())
			detail = response.body.empty()
				? json()
				: json(response.body);

		LogFmt(1, log_domain, "Reclaim API Error ({}) - Status: {}",
		       context, status);

		auto msg = MakeApiErrorMessage(context, status, detail);
		throw ApiError(status, std::move(detail), msg);
	}

	if (response.body.empty())
		return json{{"success", true}};

	try {
		return json::parse(response.body);
	} catch (const json::parse_error &) {
		std::throw_with_nested(std::runtime_error(fmt::format("API Call Failed ({}): malformed response",
								      context)));
	}
}

Co::Task<json>
HttpClient::ListTasks()
{
	auto data = Request("GET", "tasks", nullptr, "listTasks");
	if (!data.is_array())
		data = json::array();
	co_return data;
}

Co::Task<json>
HttpClient::GetTask(TaskId id)
{
	co_return Request("GET", fmt::format("tasks/{}", id), nullptr,
			  fmt::format("getTask(taskId={})", id));
}

Co::Task<json>
HttpClient::CreateTask(json body)
{
	co_return Request("POST", "tasks", &body, "createTask");
}

Co::Task<json>
HttpClient::CreateTaskAtTime(std::string start_time, json body)
{
	co_return Request("POST",
			  fmt::format("tasks/at-time?startTime={}",
				      CurlEscape(start_time)),
			  &body,
			  fmt::format("createTaskAtTime(startTime={})",
				      start_time));
}

Co::Task<json>
HttpClient::UpdateTask(TaskId id, json body)
{
	co_return Request("PATCH", fmt::format("tasks/{}", id), &body,
			  fmt::format("updateTask(taskId={})", id));
}

Co::Task<void>
HttpClient::DeleteTask(TaskId id)
{
	Request("DELETE", fmt::format("tasks/{}", id), nullptr,
		fmt::format("deleteTask(taskId={})", id));
	co_return;
}

Co::Task<json>
HttpClient::Plan(PlannerAction action, TaskId id)
{
	co_return Request("POST",
			  fmt::format("planner/{}/task/{}", ToString(action), id),
			  nullptr,
			  fmt::format("{}(taskId={})", ToString(action), id));
}

Co::Task<json>
HttpClient::AddTime(TaskId id, unsigned minutes)
{
	co_return Request("POST",
			  fmt::format("planner/add-time/task/{}?minutes={}",
				      id, minutes),
			  nullptr,
			  fmt::format("addTimeToTask(taskId={}, minutes={})",
				      id, minutes));
}

Co::Task<json>
HttpClient::LogWork(TaskId id, unsigned minutes,
		    std::optional<std::string> end)
{
	std::string path = fmt::format("planner/log-work/task/{}?minutes={}",
				       id, minutes);
	if (end) {
		path += "&end=";
		path += CurlEscape(*end);
	}

	co_return Request("POST", path, nullptr,
			  fmt::format("logWorkForTask(taskId={}, minutes={}, end={})",
				      id, minutes, end ? *end : "now"));
}

Co::Task<json>
HttpClient::FetchCurrentUser()
{
	co_return Request("GET", "users/current", nullptr, "getCurrentUser");
}

} // namespace Reclaim
