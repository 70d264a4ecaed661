// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ToolResult.hxx"
#include "reclaim/Error.hxx"
#include "lib/nlohmann_json/String.hxx"
#include "io/Logger.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

namespace Mcp {

using json = nlohmann::json;

static json
MakeTextContent(std::string_view text)
{
	return {{"type", "text"}, {"text", text}};
}

json
MakeToolResult(const json &result)
{
	return {
		{"content", json::array({MakeTextContent(result.dump(2))})},
		{"structuredContent", {{"result", result}}},
	};
}

void
AppendToolText(json &tool_result, std::string_view text)
{
	tool_result["content"].push_back(MakeTextContent(text));
}

/**
 * Extract a short explanation from the API error detail: its
 * "detail" member if it is short, or its "message" member if that is
 * not already part of the main message.
 */
static std::string_view
GetDetailString(const json &detail, std::string_view message) noexcept
{
	if (const auto d = Json::GetStringRobust(detail, "detail");
	    !d.empty() && d.size() < 150)
		return d;

	if (const auto m = Json::GetStringRobust(detail, "message");
	    !m.empty() && m != message)
		return m;

	if (detail.is_string()) {
		const auto &s = detail.get_ref<const std::string &>();
		if (!s.empty() && s.size() < 150 && s != message)
			return s;
	}

	return {};
}

std::string
FormatToolError(std::exception_ptr error)
{
	try {
		std::rethrow_exception(error);
	} catch (const Reclaim::ApiError &e) {
		const std::string_view message = e.what();
		const auto &detail = e.GetDetail();

		std::string result = e.GetStatus() != 0
			? fmt::format("Error {}: {}", e.GetStatus(), message)
			: fmt::format("Error: {}", message);

		if (const auto title = Json::GetStringRobust(detail, "title");
		    !title.empty())
			result += fmt::format(" - {}", title);

		if (const auto d = GetDetailString(detail, message); !d.empty())
			result += fmt::format(" ({})", d);

		return result;
	} catch (const std::exception &e) {
		return fmt::format("Error: {}", GetFullMessage(e));
	} catch (...) {
		return "Error: An unknown error occurred.";
	}
}

json
MakeToolError(std::exception_ptr error)
{
	const auto message = FormatToolError(error);
	LogFmt(1, "mcp", "MCP Tool Error: {}", message);

	return {
		{"isError", true},
		{"content", json::array({MakeTextContent(message)})},
	};
}

} // namespace Mcp
