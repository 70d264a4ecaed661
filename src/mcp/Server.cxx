// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Server.hxx"
#include "JsonRpc.hxx"
#include "ToolHandler.hxx"
#include "lib/nlohmann_json/String.hxx"
#include "io/Logger.hxx"
#include "util/Exception.hxx"
#include "util/StringStrip.hxx"
#include "version.h"

#include <fmt/format.h>

#include <stdexcept>
#include <system_error>

#include <errno.h>
#include <stdio.h>

namespace Mcp {

using json = nlohmann::json;

static constexpr std::string_view protocol_versions[] = {
	"2025-06-18",
	"2025-03-26",
	"2024-11-05",
};

[[gnu::pure]]
static std::string_view
NegotiateProtocolVersion(std::string_view requested) noexcept
{
	for (const auto i : protocol_versions)
		if (requested == i)
			return i;

	/* the newest one we know */
	return protocol_versions[0];
}

static json
Initialize(const json &params)
{
	return {
		{"protocolVersion",
		 NegotiateProtocolVersion(Json::GetStringRobust(params, "protocolVersion"))},
		{"capabilities", {
				{"tools", {{"listChanged", false}}},
				{"resources", {{"listChanged", false}}},
			}},
		{"serverInfo", {
				{"name", PACKAGE},
				{"version", VERSION},
			}},
	};
}

static std::string
GetRequiredString(const json &params, const char *name)
{
	const auto value = Json::GetStringRobust(params, name);
	if (value.empty())
		throw JsonRpcError(JsonRpcErrorCode::INVALID_PARAMS,
				   fmt::format("Missing parameter \"{}\"", name));

	return std::string{value};
}

Co::Task<json>
Server::Dispatch(std::string_view method, const json &params)
{
	if (method == "initialize") {
		co_return Initialize(params);
	} else if (method == "ping") {
		co_return json::object();
	} else if (method == "tools/list") {
		co_return ToolHandler::ListTools();
	} else if (method == "tools/call") {
		json arguments = json::object();
		if (const auto i = params.find("arguments");
		    i != params.end() && !i->is_null()) {
			if (!i->is_object())
				throw JsonRpcError(JsonRpcErrorCode::INVALID_PARAMS,
						   "\"arguments\" must be an object");
			arguments = *i;
		}

		co_return co_await tools.Call(GetRequiredString(params, "name"),
					      std::move(arguments));
	} else if (method == "resources/list") {
		co_return ToolHandler::ListResources();
	} else if (method == "resources/read") {
		co_return co_await tools.ReadResource(GetRequiredString(params, "uri"));
	} else if (method.starts_with("notifications/")) {
		/* nothing to do for "initialized", "cancelled" etc. */
		co_return json::object();
	}

	throw JsonRpcError(JsonRpcErrorCode::METHOD_NOT_FOUND,
			   fmt::format("Method not found: {}", method));
}

Co::Task<std::optional<json>>
Server::HandleMessage(json message)
{
	if (!message.is_object())
		co_return MakeErrorResponse(nullptr,
					    JsonRpcErrorCode::INVALID_REQUEST,
					    "Invalid Request");

	const auto id_i = message.find("id");
	const bool is_notification = id_i == message.end();
	const json id = is_notification ? json{} : *id_i;

	const std::string method{Json::GetStringRobust(message, "method")};
	if (method.empty()) {
		if (is_notification)
			co_return std::nullopt;

		co_return MakeErrorResponse(id,
					    JsonRpcErrorCode::INVALID_REQUEST,
					    "Invalid Request");
	}

	LogFmt(3, "mcp", "request \"{}\" id={}", method, id.dump());

	json params = json::object();
	if (const auto i = message.find("params");
	    i != message.end() && i->is_object())
		params = std::move(*i);

	JsonRpcErrorCode error_code{};
	std::string error_message;
	json result;

	try {
		result = co_await Dispatch(method, params);
	} catch (const JsonRpcError &e) {
		error_code = e.GetCode();
		error_message = e.what();
	} catch (...) {
		error_code = JsonRpcErrorCode::INTERNAL_ERROR;
		error_message = GetFullMessage(std::current_exception());
	}

	if (!error_message.empty()) {
		LogFmt(2, "mcp", "\"{}\" failed: {}", method, error_message);

		if (is_notification)
			co_return std::nullopt;

		co_return MakeErrorResponse(id, error_code, error_message);
	}

	if (is_notification)
		co_return std::nullopt;

	co_return MakeResponse(id, std::move(result));
}

Co::Task<std::optional<std::string>>
Server::HandleLine(std::string line)
{
	const std::string_view s = Strip(std::string_view{line});
	if (s.empty())
		co_return std::nullopt;

	json message = json::parse(s, nullptr, false);
	if (message.is_discarded()) {
		LogFmt(2, "mcp", "Malformed JSON message");
		co_return MakeErrorResponse(nullptr,
					    JsonRpcErrorCode::PARSE_ERROR,
					    "Parse error").dump();
	}

	auto response = co_await HandleMessage(std::move(message));
	if (!response)
		co_return std::nullopt;

	co_return response->dump();
}

void
Server::Write(std::string_view response)
{
	if (fwrite(response.data(), 1, response.size(), output) != response.size() ||
	    fputc('\n', output) == EOF ||
	    fflush(output) != 0)
		throw std::system_error(errno, std::system_category(),
					"Failed to write response");
}

Co::InvokeTask
Server::ProcessLine(std::string line)
{
	const auto response = co_await HandleLine(std::move(line));
	if (response)
		Write(*response);
}

void
Server::OnLineCompletion(std::exception_ptr error) noexcept
{
	if (error)
		LoggerDetail::LogException(1, "mcp", "Request failed",
					   std::move(error));
}

void
Server::PrunePending() noexcept
{
	pending.remove_if([](const Co::InvokeTask &task){
		return task.done();
	});
}

/**
 * Read one line (including the newline character) into the given
 * string.
 *
 * @return false on end of file or error
 */
static bool
ReadLine(FILE *file, std::string &line)
{
	line.clear();

	char buffer[4096];
	while (fgets(buffer, sizeof(buffer), file) != nullptr) {
		line.append(buffer);
		if (line.back() == '\n')
			return true;
	}

	/* the last line may lack the newline */
	return !line.empty() && !ferror(file);
}

void
Server::Run(FILE *input)
{
	std::string line;
	while (ReadLine(input, line)) {
		PrunePending();

		auto &task = pending.emplace_back(ProcessLine(std::move(line)));
		task.OnCompletion(BIND_THIS_METHOD(OnLineCompletion));
	}

	if (ferror(input))
		throw std::system_error(errno, std::system_category(),
					"Failed to read request");

	PrunePending();

	if (!pending.empty())
		LogFmt(2, "mcp", "{} requests still pending at end of input",
		       pending.size());
}

} // namespace Mcp
