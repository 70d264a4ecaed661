// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <string>
#include <string_view>

/**
 * URL-encode a string for use in a query parameter.
 *
 * Throws std::bad_alloc on error.
 */
std::string
CurlEscape(std::string_view s);
