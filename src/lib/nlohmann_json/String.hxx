// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <nlohmann/json.hpp>

#include <string_view>

namespace Json {

[[gnu::pure]]
inline std::string_view
GetString(const nlohmann::json *j) noexcept
{
	return j != nullptr && j->is_string()
		? j->get_ref<const std::string &>()
		: std::string_view{};
}

/**
 * Look up a string member.  Returns an empty string if the member
 * does not exist or is not a string.
 */
[[gnu::pure]]
inline std::string_view
GetStringRobust(const nlohmann::json &j, std::string_view key) noexcept
{
	if (!j.is_object())
		return {};

	if (const auto i = j.find(key); i != j.end() && i->is_string())
		return i->get_ref<const std::string &>();
	else
		return {};
}

} // namespace Json
