// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "co/InvokeTask.hxx"
#include "co/Task.hxx"

#include <nlohmann/json.hpp>

#include <list>
#include <optional>
#include <string>
#include <string_view>

#include <stdio.h>

namespace Mcp {

class ToolHandler;

/**
 * A MCP server speaking JSON-RPC 2.0 over a line-oriented stream
 * (one JSON message per line).
 */
class Server {
	ToolHandler &tools;

	FILE *const output;

	/**
	 * Requests which are still being handled.
	 */
	std::list<Co::InvokeTask> pending;

public:
	Server(ToolHandler &_tools, FILE *_output) noexcept
		:tools(_tools), output(_output) {}

	Server(const Server &) = delete;
	Server &operator=(const Server &) = delete;

	/**
	 * Handle one parsed JSON-RPC message.  Returns the response
	 * or std::nullopt if the message is a notification.
	 */
	Co::Task<std::optional<nlohmann::json>> HandleMessage(nlohmann::json message);

	/**
	 * Like HandleMessage(), but parse the line first and
	 * serialize the response.
	 */
	Co::Task<std::optional<std::string>> HandleLine(std::string line);

	/**
	 * Read messages from the given stream until end of file and
	 * write the responses to the output stream.
	 *
	 * Throws on I/O error.
	 */
	void Run(FILE *input);

	std::size_t GetPendingCount() const noexcept {
		return pending.size();
	}

private:
	Co::Task<nlohmann::json> Dispatch(std::string_view method,
					  const nlohmann::json &params);

	Co::InvokeTask ProcessLine(std::string line);
	void OnLineCompletion(std::exception_ptr error) noexcept;

	void Write(std::string_view response);

	void PrunePending() noexcept;
};

} // namespace Mcp
