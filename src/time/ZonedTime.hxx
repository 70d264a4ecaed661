// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

/**
 * Determine the UTC offset of the given zone at the given instant,
 * i.e. the difference between the zone's wall clock rendering of the
 * instant (read as UTC) and the instant itself.
 */
[[gnu::pure]]
absl::Duration
GetZoneOffset(absl::Time t, const absl::TimeZone &tz) noexcept;

/**
 * Convert a wall clock time in the given zone to an absolute instant.
 *
 * This does not consult the zone's transition table directly;
 * instead, it probes the offsets observed around the requested time
 * and picks the candidate whose rendering matches.  If the wall
 * clock time occurs twice (the hour repeated when clocks go back),
 * the earlier instant is returned.  If it does not exist at all
 * (skipped when clocks go forward), the first instant whose rendering
 * is at or after the requested time is returned.
 */
[[gnu::pure]]
absl::Time
ZonedTimeToUtc(absl::CivilSecond local, const absl::TimeZone &tz) noexcept;
