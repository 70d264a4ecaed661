// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <curl/curl.h>

#include <stdexcept>
#include <string>

namespace Curl {

/**
 * Construct an exception describing the given CURL error code.
 */
inline std::runtime_error
MakeError(CURLcode code, const char *msg)
{
	return std::runtime_error(std::string(msg) + ": " +
				  curl_easy_strerror(code));
}

} // namespace Curl
