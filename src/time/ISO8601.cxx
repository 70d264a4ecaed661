// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ISO8601.hxx"

#include <absl/time/time.h>

std::string
FormatISO8601(std::chrono::system_clock::time_point tp)
{
	return absl::FormatTime("%Y-%m-%dT%H:%M:%E3SZ", absl::FromChrono(tp),
				absl::UTCTimeZone());
}
