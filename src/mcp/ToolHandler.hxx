// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "co/Task.hxx"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace Reclaim {
class RecordService;
class AccountCache;
struct ResolutionContext;
}

namespace Mcp {

/**
 * Implements the MCP tools and resources on top of a
 * #Reclaim::RecordService.
 */
class ToolHandler {
public:
	using Clock = std::chrono::system_clock::time_point (*)() noexcept;

private:
	Reclaim::RecordService &service;
	Reclaim::AccountCache &account;

	/**
	 * The configured default time zone (may be empty).
	 */
	const std::string default_time_zone;

	const Clock clock;

public:
	ToolHandler(Reclaim::RecordService &_service,
		    Reclaim::AccountCache &_account,
		    std::string_view _default_time_zone,
		    Clock _clock=std::chrono::system_clock::now) noexcept;

	/**
	 * The result of "tools/list".
	 */
	static nlohmann::json ListTools();

	/**
	 * Handle "tools/call".  Errors are returned as a tool result
	 * with "isError" set, except for an unknown tool name, which
	 * throws #JsonRpcError.
	 */
	Co::Task<nlohmann::json> Call(std::string name,
				      nlohmann::json arguments);

	/**
	 * The result of "resources/list".
	 */
	static nlohmann::json ListResources();

	/**
	 * Handle "resources/read".  Throws #JsonRpcError if the URI is
	 * unknown and std::runtime_error if fetching the data fails.
	 */
	Co::Task<nlohmann::json> ReadResource(std::string uri);

private:
	Co::Task<nlohmann::json> Invoke(std::string_view name,
					const nlohmann::json &args);

	Co::Task<Reclaim::ResolutionContext> MakeContext(std::string time_zone);

	Co::Task<nlohmann::json> GetTaskDefaults();
	Co::Task<nlohmann::json> ListTasks(const nlohmann::json &args);
	Co::Task<nlohmann::json> GetTask(const nlohmann::json &args);
	Co::Task<nlohmann::json> CreateTask(const nlohmann::json &args);
	Co::Task<nlohmann::json> UpdateTask(const nlohmann::json &args);
	Co::Task<nlohmann::json> DeleteTask(const nlohmann::json &args);
	Co::Task<nlohmann::json> AddTime(const nlohmann::json &args);
	Co::Task<nlohmann::json> LogWork(const nlohmann::json &args);

	Co::Task<nlohmann::json> ReadResourceData(std::string_view uri);
};

} // namespace Mcp
