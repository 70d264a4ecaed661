// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Escape.hxx"

#include <curl/curl.h>

#include <memory>
#include <new>

struct CurlFree {
	void operator()(char *p) const noexcept {
		curl_free(p);
	}
};

std::string
CurlEscape(std::string_view s)
{
	std::unique_ptr<char, CurlFree> result{curl_easy_escape(nullptr, s.data(), s.size())};
	if (!result)
		throw std::bad_alloc();

	return result.get();
}
