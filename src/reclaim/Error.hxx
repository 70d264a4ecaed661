// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace Reclaim {

/**
 * A caller-supplied value was rejected (malformed date/time, a
 * duration which is not a multiple of the chunk size, ...).
 */
class InvalidInput : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

/**
 * The given time zone identifier is not known.
 */
class InvalidTimezone : public InvalidInput {
public:
	using InvalidInput::InvalidInput;
};

/**
 * The minimum chunk size exceeds the maximum chunk size.
 */
class ChunkSizeConflict : public InvalidInput {
public:
	using InvalidInput::InvalidInput;
};

/**
 * The Reclaim API has responded with an error status.
 */
class ApiError : public std::runtime_error {
	unsigned status;

	/**
	 * The parsed response body (may be null).
	 */
	nlohmann::json detail;

public:
	ApiError(unsigned _status, nlohmann::json &&_detail,
		 const std::string &_msg)
		:std::runtime_error(_msg),
		 status(_status), detail(std::move(_detail)) {}

	unsigned GetStatus() const noexcept {
		return status;
	}

	const nlohmann::json &GetDetail() const noexcept {
		return detail;
	}
};

} // namespace Reclaim
