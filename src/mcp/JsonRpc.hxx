// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace Mcp {

enum class JsonRpcErrorCode : int {
	PARSE_ERROR = -32700,
	INVALID_REQUEST = -32600,
	METHOD_NOT_FOUND = -32601,
	INVALID_PARAMS = -32602,
	INTERNAL_ERROR = -32603,

	/**
	 * MCP extension: the requested resource does not exist.
	 */
	RESOURCE_NOT_FOUND = -32002,
};

/**
 * An error which is reported as a JSON-RPC error response (and not
 * as a tool result).
 */
class JsonRpcError : public std::runtime_error {
	JsonRpcErrorCode code;

public:
	JsonRpcError(JsonRpcErrorCode _code, const std::string &_msg)
		:std::runtime_error(_msg), code(_code) {}

	JsonRpcErrorCode GetCode() const noexcept {
		return code;
	}
};

inline nlohmann::json
MakeResponse(const nlohmann::json &id, nlohmann::json &&result)
{
	return {
		{"jsonrpc", "2.0"},
		{"id", id},
		{"result", std::move(result)},
	};
}

inline nlohmann::json
MakeErrorResponse(const nlohmann::json &id, JsonRpcErrorCode code,
		  std::string_view message)
{
	return {
		{"jsonrpc", "2.0"},
		{"id", id},
		{"error", {
				{"code", static_cast<int>(code)},
				{"message", message},
			}},
	};
}

} // namespace Mcp
