// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <string_view>

namespace Reclaim {

/**
 * The scheduling unit of the Reclaim API.
 */
static constexpr std::chrono::minutes CHUNK_DURATION{15};

/**
 * Convert a number of minutes to chunks.  Throws #InvalidInput if
 * the value is not a positive multiple of #CHUNK_DURATION.
 *
 * @param field the name of the field (for the error message)
 */
unsigned
MinutesToChunks(unsigned minutes, std::string_view field);

constexpr std::chrono::minutes
ChunksToDuration(unsigned chunks) noexcept
{
	return CHUNK_DURATION * chunks;
}

} // namespace Reclaim
