// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <nlohmann/json.hpp>

#include <exception>
#include <string>
#include <string_view>

namespace Mcp {

/**
 * Build a successful "tools/call" result: the pretty-printed JSON as
 * text content plus the same value as structured content.
 */
nlohmann::json
MakeToolResult(const nlohmann::json &result);

/**
 * Append another text block to a successful result.
 */
void
AppendToolText(nlohmann::json &tool_result, std::string_view text);

/**
 * Format an exception as a message for the user, e.g. "Error 404:
 * API Call Failed (getTask(taskId=1)): Not Found - Not Found (Task
 * does not exist)".
 */
std::string
FormatToolError(std::exception_ptr error);

/**
 * Build a "tools/call" result with "isError" set and log the error.
 */
nlohmann::json
MakeToolError(std::exception_ptr error);

} // namespace Mcp
