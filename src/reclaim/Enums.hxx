// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace Reclaim {

/**
 * The canonical tags of one enumerated field, plus colloquial
 * aliases which are consulted if the primary lookup fails.
 */
struct EnumTable {
	std::span<const std::string_view> primary;
	std::span<const std::pair<std::string_view, std::string_view>> aliases;
};

extern const EnumTable category_table;
extern const EnumTable priority_table;
extern const EnumTable sub_type_table;
extern const EnumTable color_table;
extern const EnumTable status_table;

/**
 * Trim, convert to upper case and replace spaces and hyphens with
 * underscores.
 */
std::string
CanonicalizeToken(std::string_view s);

/**
 * Look up a user-supplied value in the table.
 *
 * @return the canonical tag or std::nullopt if the value is not
 * recognized
 */
std::optional<std::string_view>
Lookup(const EnumTable &table, std::string_view value);

/**
 * Is this (canonical) sub-type one of the personal ones?
 */
[[gnu::pure]]
bool
IsPersonalSubType(std::string_view sub_type) noexcept;

/**
 * Determine the category ("WORK" or "PERSONAL") a canonical sub-type
 * belongs to.
 */
[[gnu::pure]]
std::string_view
InferCategory(std::string_view sub_type) noexcept;

/**
 * The sub-type used for unrecognized values, depending on the
 * category.
 */
[[gnu::pure]]
std::string_view
DefaultSubType(std::string_view category) noexcept;

} // namespace Reclaim
