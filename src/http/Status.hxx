// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

/**
 * The HTTP status codes the Reclaim API is known to respond with.
 * Other values may still occur; they are passed through numerically.
 */
enum class HttpStatus : uint_least16_t {
	/**
	 * Not an actual HTTP status code, but a "magic" value which
	 * means this status has no value.  This can be used as an
	 * initializer.
	 */
	UNDEFINED = 0,

	OK = 200,
	CREATED = 201,
	NO_CONTENT = 204,

	BAD_REQUEST = 400,
	UNAUTHORIZED = 401,
	FORBIDDEN = 403,
	NOT_FOUND = 404,
	CONFLICT = 409,
	UNPROCESSABLE_ENTITY = 422,
	TOO_MANY_REQUESTS = 429,

	INTERNAL_SERVER_ERROR = 500,
	BAD_GATEWAY = 502,
	SERVICE_UNAVAILABLE = 503,
};

constexpr bool
HttpStatusIsSuccess(HttpStatus status) noexcept
{
	return static_cast<unsigned>(status) >= 200 &&
		static_cast<unsigned>(status) < 300;
}

constexpr bool
HttpStatusIsError(HttpStatus status) noexcept
{
	return static_cast<unsigned>(status) >= 400;
}
