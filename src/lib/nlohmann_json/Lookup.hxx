// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <nlohmann/json.hpp>

#include <string_view>
#include <utility>

namespace Json {

[[gnu::pure]]
inline const nlohmann::json *
Lookup(const nlohmann::json &j, std::string_view key) noexcept
{
	if (!j.is_object())
		return nullptr;

	const auto i = j.find(key);
	return i != j.end() ? &*i : nullptr;
}

/**
 * Walk down a chain of object members, e.g. Lookup(j, "a", "b") is
 * j["a"]["b"].  Returns nullptr if any of them is missing.
 */
template<typename K, typename... Args>
[[gnu::pure]]
inline const nlohmann::json *
Lookup(const nlohmann::json &j, std::string_view key,
       K &&next, Args&&... args) noexcept
{
	const auto *l = Lookup(j, key);
	return l != nullptr
		? Lookup(*l, std::forward<K>(next), std::forward<Args>(args)...)
		: nullptr;
}

} // namespace Json
