// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "StringGlue.hxx"
#include "Easy.hxx"
#include "http/Status.hxx"

#include <new>
#include <string>

static std::size_t
WriteFunction(char *ptr, std::size_t size, std::size_t nmemb,
	      void *userdata) noexcept
{
	auto &body = *(std::string *)userdata;
	const std::size_t length = size * nmemb;

	try {
		body.append(ptr, length);
	} catch (const std::bad_alloc &) {
		/* a short count makes CURL abort the transfer with
		   CURLE_WRITE_ERROR */
		return 0;
	}

	return length;
}

StringCurlResponse
StringCurlRequest(CurlEasy easy)
{
	StringCurlResponse response{};
	easy.SetWriteFunction(WriteFunction, &response.body);

	easy.Perform();

	response.status = static_cast<HttpStatus>(easy.GetResponseCode());
	return response;
}
