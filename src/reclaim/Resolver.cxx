// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Resolver.hxx"
#include "Error.hxx"
#include "time/Calendar.hxx"
#include "time/ISO8601.hxx"
#include "time/ZonedTime.hxx"
#include "io/Logger.hxx"
#include "util/CharUtil.hxx"
#include "util/StringStrip.hxx"

#include <absl/time/civil_time.h>

#include <fmt/format.h>

#include <optional>
#include <string>

namespace Reclaim {

static constexpr std::string_view log_domain = "time";

/**
 * Relative dates beyond this many days from now are rejected.
 */
static constexpr long max_relative_days = 100 * 366;

/**
 * The calendar fields of a date/time string without an offset.
 */
struct LocalDateTime {
	int year;
	unsigned month, day;
	unsigned hour = 0, minute = 0, second = 0, millisecond = 0;
};

/**
 * Parse exactly the given number of decimal digits.
 */
static bool
ParseDigits(std::string_view &s, std::size_t n, unsigned &value_r) noexcept
{
	if (s.size() < n)
		return false;

	unsigned value = 0;
	for (std::size_t i = 0; i < n; ++i) {
		if (!IsDigitASCII(s[i]))
			return false;

		value = value * 10 + (s[i] - '0');
	}

	s.remove_prefix(n);
	value_r = value;
	return true;
}

static bool
SkipChar(std::string_view &s, char ch) noexcept
{
	if (s.empty() || s.front() != ch)
		return false;

	s.remove_prefix(1);
	return true;
}

/**
 * Parse "YYYY-MM-DD[(T| )HH[:MM[:SS[.f{1,3}]]]]".  This only checks
 * the syntax; the ranges are checked by CheckRanges().
 *
 * @return std::nullopt if the string does not match
 */
static std::optional<LocalDateTime>
ParseLocalDateTime(std::string_view s) noexcept
{
	LocalDateTime t;

	unsigned year;
	if (!ParseDigits(s, 4, year) || !SkipChar(s, '-') ||
	    !ParseDigits(s, 2, t.month) || !SkipChar(s, '-') ||
	    !ParseDigits(s, 2, t.day))
		return std::nullopt;

	t.year = year;

	if (s.empty())
		return t;

	if (s.front() != 'T' && !IsWhitespaceNotNull(s.front()))
		return std::nullopt;

	s.remove_prefix(1);

	if (!ParseDigits(s, 2, t.hour))
		return std::nullopt;

	if (SkipChar(s, ':')) {
		if (!ParseDigits(s, 2, t.minute))
			return std::nullopt;

		if (SkipChar(s, ':')) {
			if (!ParseDigits(s, 2, t.second))
				return std::nullopt;

			if (SkipChar(s, '.')) {
				/* 1 to 3 fractional digits, right-padded
				   to milliseconds */
				std::size_t n = 0;
				unsigned ms = 0;
				while (n < s.size() && IsDigitASCII(s[n])) {
					if (n == 3)
						return std::nullopt;

					ms = ms * 10 + (s[n] - '0');
					++n;
				}

				if (n == 0)
					return std::nullopt;

				for (std::size_t i = n; i < 3; ++i)
					ms *= 10;

				s.remove_prefix(n);
				t.millisecond = ms;
			}
		}
	}

	if (!s.empty())
		return std::nullopt;

	return t;
}

static void
CheckRanges(const LocalDateTime &t, std::string_view input)
{
	if (t.month < 1 || t.month > 12)
		throw InvalidInput(fmt::format("Invalid date/time \"{}\": month {} is out of range (1-12)",
					       input, t.month));

	if (t.day < 1 || t.day > DaysInMonth(t.year, t.month))
		throw InvalidInput(fmt::format("Invalid date/time \"{}\": {:04}-{:02} has no day {}",
					       input, t.year, t.month, t.day));

	if (t.hour > 23)
		throw InvalidInput(fmt::format("Invalid hour {} in \"{}\" (expected 0-23)",
					       t.hour, input));

	if (t.minute > 59)
		throw InvalidInput(fmt::format("Invalid minute {} in \"{}\" (expected 0-59)",
					       t.minute, input));

	if (t.second > 59)
		throw InvalidInput(fmt::format("Invalid second {} in \"{}\" (expected 0-59)",
					       t.second, input));
}

static absl::CivilSecond
ToCivilSecond(const LocalDateTime &t) noexcept
{
	return absl::CivilSecond(t.year, t.month, t.day,
				 t.hour, t.minute, t.second);
}

/**
 * Does the string end with "Z" or "±HH:MM"?  If yes, return the
 * offset (east of UTC) and remove the suffix.
 *
 * Throws #InvalidInput if the offset is out of range.
 */
static std::optional<absl::Duration>
CutOffsetSuffix(std::string_view &s, std::string_view input)
{
	if (s.empty())
		return std::nullopt;

	if (s.back() == 'Z' || s.back() == 'z') {
		s.remove_suffix(1);
		return absl::ZeroDuration();
	}

	if (s.size() < 6)
		return std::nullopt;

	std::string_view suffix = s.substr(s.size() - 6);
	const char sign = suffix.front();
	if (sign != '+' && sign != '-')
		return std::nullopt;

	suffix.remove_prefix(1);

	unsigned hours, minutes;
	if (!ParseDigits(suffix, 2, hours) || !SkipChar(suffix, ':') ||
	    !ParseDigits(suffix, 2, minutes))
		return std::nullopt;

	if (hours > 23 || minutes > 59)
		throw InvalidInput(fmt::format("Invalid UTC offset in \"{}\"",
					       input));

	s.remove_suffix(6);

	const auto offset = absl::Hours(hours) + absl::Minutes(minutes);
	return sign == '-' ? -offset : offset;
}

[[gnu::pure]]
static bool
IsFinite(absl::Time t) noexcept
{
	return t != absl::InfiniteFuture() && t != absl::InfinitePast();
}

/**
 * Parse the commonly used notations which carry an explicit offset
 * (or name UTC).
 */
static std::optional<absl::Time>
ParseZonedFallback(std::string_view s) noexcept
{
	static const char *const formats[] = {
		absl::RFC3339_full,
		absl::RFC1123_full,
		absl::RFC1123_no_wday,
		"%Y-%m-%d %H:%M:%E*S %z",
		"%Y-%m-%dT%H:%M:%E*S%z",
		"%a, %d %b %Y %H:%M:%S GMT",
		"%d %b %Y %H:%M:%S GMT",
		"%Y-%m-%d%ET%H:%M:%E*S GMT",
		"%Y-%m-%d%ET%H:%M:%E*S UTC",
		"%Y-%m-%d %H:%M:%E*S GMT",
		"%Y-%m-%d %H:%M:%E*S UTC",
	};

	const std::string input(s);

	for (const char *format : formats) {
		absl::Time t;
		if (absl::ParseTime(format, input, &t, nullptr) && IsFinite(t))
			return t;
	}

	return std::nullopt;
}

/**
 * Parse the commonly used notations without an offset, e.g.
 * "2026/01/05 08:00" or "January 5, 2026".  The result is a wall
 * clock time which still needs a time zone.
 */
static std::optional<absl::Time>
ParseLocalFallback(std::string_view s) noexcept
{
	static const char *const formats[] = {
		"%Y/%m/%d %H:%M:%S",
		"%Y/%m/%d %H:%M",
		"%Y/%m/%d",
		"%m/%d/%Y %H:%M:%S",
		"%m/%d/%Y %H:%M",
		"%m/%d/%Y",
		"%B %d, %Y %H:%M:%S",
		"%B %d, %Y %H:%M",
		"%B %d, %Y",
		"%B %d %Y %H:%M:%S",
		"%B %d %Y %H:%M",
		"%B %d %Y",
		"%d %B %Y %H:%M:%S",
		"%d %B %Y %H:%M",
		"%d %B %Y",
		"%a, %d %b %Y %H:%M:%S",
		"%a %b %d %Y %H:%M:%S",
		"%a %b %d %Y",
	};

	const std::string input(s);

	/* parsed as UTC, only the calendar fields matter */
	for (const char *format : formats) {
		absl::Time t;
		if (absl::ParseTime(format, input, absl::UTCTimeZone(), &t, nullptr) &&
		    IsFinite(t))
			return t;
	}

	return std::nullopt;
}

static std::chrono::system_clock::time_point
ToTimePoint(absl::Time t) noexcept
{
	return absl::ToChronoTime(t);
}

std::string_view
ResolutionContext::GetTimeZoneName() const noexcept
{
	for (const std::string *i : {&time_zone, &default_time_zone, &account_time_zone}) {
		const auto name = Strip(std::string_view{*i});
		if (!name.empty())
			return name;
	}

	return {};
}

absl::TimeZone
ResolutionContext::GetTimeZone() const
{
	const auto name = GetTimeZoneName();
	if (name.empty())
		return absl::LocalTimeZone();

	return LoadZone(name);
}

absl::TimeZone
LoadZone(std::string_view name)
{
	absl::TimeZone tz;
	if (name.empty() || !absl::LoadTimeZone(std::string{name}, &tz))
		throw InvalidTimezone(fmt::format("Invalid timeZone \"{}\". Use an IANA time zone like \"America/Los_Angeles\".",
						  name));

	return tz;
}

std::chrono::system_clock::time_point
ResolveRelativeDays(long days, const ResolutionContext &context)
{
	if (days <= 0) {
		LogFmt(1, log_domain,
		       "Received non-positive number of days {} for a date field, using the current time",
		       days);
		return context.now;
	}

	if (days > max_relative_days)
		throw InvalidInput(fmt::format("Number of days {} is too large (at most {})",
					       days, max_relative_days));

	return ToTimePoint(absl::FromChrono(context.now) + absl::Hours(24) * days);
}

std::chrono::system_clock::time_point
ResolveDateTime(std::string_view input, const ResolutionContext &context)
{
	std::string_view s = Strip(input);

	if (std::string_view rest = s; const auto offset = CutOffsetSuffix(rest, input)) {
		if (const auto t = ParseLocalDateTime(rest)) {
			CheckRanges(*t, input);
			return ToTimePoint(absl::FromCivil(ToCivilSecond(*t),
							   absl::UTCTimeZone())
					   - *offset
					   + absl::Milliseconds(t->millisecond));
		}

		if (const auto t = ParseZonedFallback(s))
			return ToTimePoint(*t);

		throw InvalidInput(fmt::format("Invalid date/time format: \"{}\"",
					       input));
	}

	if (const auto t = ParseLocalDateTime(s)) {
		CheckRanges(*t, input);

		const auto tz = context.GetTimeZone();
		return ToTimePoint(ZonedTimeToUtc(ToCivilSecond(*t), tz)
				   + absl::Milliseconds(t->millisecond));
	}

	if (const auto t = ParseZonedFallback(s))
		return ToTimePoint(*t);

	if (const auto t = ParseLocalFallback(s)) {
		const auto utc = absl::UTCTimeZone();
		const auto local = absl::ToCivilSecond(*t, utc);
		const auto fraction = *t - absl::FromCivil(local, utc);

		const auto tz = context.GetTimeZone();
		return ToTimePoint(ZonedTimeToUtc(local, tz) + fraction);
	}

	throw InvalidInput(fmt::format("Invalid date/time format: \"{}\"",
				       input));
}

std::chrono::system_clock::time_point
Resolve(const TimeExpression &expression, const ResolutionContext &context)
{
	if (const auto *days = std::get_if<RelativeDays>(&expression))
		return ResolveRelativeDays(days->count, context);

	return ResolveDateTime(std::get<std::string>(expression), context);
}

std::string
ResolveToString(const TimeExpression &expression,
		const ResolutionContext &context)
{
	return FormatISO8601(Resolve(expression, context));
}

} // namespace Reclaim
