// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <absl/time/time.h>

#include <chrono>
#include <string>
#include <string_view>
#include <variant>

namespace Reclaim {

/**
 * A number of days from now, delivered through a numeric channel
 * (a JSON number, not a string).
 */
struct RelativeDays {
	long count;
};

/**
 * A date/time as given by the user: either a #RelativeDays or a
 * string which is a local date/time ("2026-01-05T08:00"), an absolute
 * date/time ("2026-01-05T16:00:00Z") or some other commonly used
 * notation with an explicit offset.
 */
using TimeExpression = std::variant<RelativeDays, std::string>;

/**
 * Everything Resolve() needs besides the expression itself.  The
 * first non-empty time zone wins; if all are empty, the machine's
 * local time zone is used.
 */
struct ResolutionContext {
	/**
	 * The time zone passed with this call.
	 */
	std::string time_zone;

	/**
	 * The process-wide default time zone (from the configuration).
	 */
	std::string default_time_zone;

	/**
	 * The time zone stored in the user's account.
	 */
	std::string account_time_zone;

	/**
	 * The evaluation instant for #RelativeDays.
	 */
	std::chrono::system_clock::time_point now;

	/**
	 * Returns the name of the selected time zone (trimmed), or an
	 * empty string if the local time zone shall be used.
	 */
	[[gnu::pure]]
	std::string_view GetTimeZoneName() const noexcept;

	/**
	 * Throws #InvalidTimezone if the selected zone is not known.
	 */
	absl::TimeZone GetTimeZone() const;
};

/**
 * Look up an IANA time zone by its name.
 *
 * Throws #InvalidTimezone on error.
 */
absl::TimeZone
LoadZone(std::string_view name);

/**
 * Resolve a #TimeExpression to an absolute instant.
 *
 * Throws #InvalidInput if the string is malformed or a calendar
 * field is out of range, #InvalidTimezone if a local date/time needs
 * a time zone which is not known.
 */
std::chrono::system_clock::time_point
Resolve(const TimeExpression &expression, const ResolutionContext &context);

std::chrono::system_clock::time_point
ResolveDateTime(std::string_view s, const ResolutionContext &context);

/**
 * Shift "now" by the given number of 24 hour days.  A non-positive
 * count logs a warning and returns "now".
 *
 * Throws #InvalidInput if the count is unreasonably large.
 */
std::chrono::system_clock::time_point
ResolveRelativeDays(long days, const ResolutionContext &context);

/**
 * Like Resolve(), but format the result as ISO 8601 with
 * milliseconds.
 */
std::string
ResolveToString(const TimeExpression &expression,
		const ResolutionContext &context);

} // namespace Reclaim
