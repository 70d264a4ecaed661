// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Chunks.hxx"
#include "Error.hxx"

#include <fmt/format.h>

namespace Reclaim {

unsigned
MinutesToChunks(unsigned minutes, std::string_view field)
{
	const unsigned chunk_minutes = CHUNK_DURATION.count();

	if (minutes == 0)
		throw InvalidInput(fmt::format("{} must be positive", field));

	if (minutes % chunk_minutes != 0)
		throw InvalidInput(fmt::format("{} must be a multiple of {} minutes. Example: 60 minutes = 4 chunks.",
					       field, chunk_minutes));

	return minutes / chunk_minutes;
}

} // namespace Reclaim
