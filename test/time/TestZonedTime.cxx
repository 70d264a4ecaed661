// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "time/ZonedTime.hxx"
#include "time/Calendar.hxx"
#include "time/ISO8601.hxx"

#include <gtest/gtest.h>

static absl::TimeZone
Zone(const char *name)
{
	absl::TimeZone tz;
	if (!absl::LoadTimeZone(name, &tz))
		throw std::runtime_error("Time zone database not available");
	return tz;
}

static std::string
Format(absl::Time t)
{
	return FormatISO8601(absl::ToChronoTime(t));
}

TEST(ZonedTime, Offset)
{
	const auto la = Zone("America/Los_Angeles");

	EXPECT_EQ(GetZoneOffset(absl::FromUnixSeconds(1767628800), la),
		  absl::Hours(-8));
	EXPECT_EQ(GetZoneOffset(absl::FromUnixSeconds(1783000000), la),
		  absl::Hours(-7));
	EXPECT_EQ(GetZoneOffset(absl::FromUnixSeconds(1767628800),
				absl::UTCTimeZone()),
		  absl::ZeroDuration());
}

TEST(ZonedTime, Regular)
{
	const auto la = Zone("America/Los_Angeles");

	EXPECT_EQ(Format(ZonedTimeToUtc(absl::CivilSecond(2026, 1, 5, 8, 0, 0), la)),
		  "2026-01-05T16:00:00.000Z");
	EXPECT_EQ(Format(ZonedTimeToUtc(absl::CivilSecond(2026, 7, 1, 12, 0, 0), la)),
		  "2026-07-01T19:00:00.000Z");

	const auto berlin = Zone("Europe/Berlin");
	EXPECT_EQ(Format(ZonedTimeToUtc(absl::CivilSecond(2026, 1, 5, 0, 0, 0), berlin)),
		  "2026-01-04T23:00:00.000Z");

	const auto kolkata = Zone("Asia/Kolkata");
	EXPECT_EQ(Format(ZonedTimeToUtc(absl::CivilSecond(2026, 1, 5, 9, 0, 0), kolkata)),
		  "2026-01-05T03:30:00.000Z");
}

TEST(ZonedTime, SpringForwardGap)
{
	const auto la = Zone("America/Los_Angeles");

	/* 02:30 does not exist on this day; the result is the first
	   instant rendered after it (03:30 PDT) */
	EXPECT_EQ(Format(ZonedTimeToUtc(absl::CivilSecond(2026, 3, 8, 2, 30, 0), la)),
		  "2026-03-08T10:30:00.000Z");

	/* just before and after the gap */
	EXPECT_EQ(Format(ZonedTimeToUtc(absl::CivilSecond(2026, 3, 8, 1, 59, 0), la)),
		  "2026-03-08T09:59:00.000Z");
	EXPECT_EQ(Format(ZonedTimeToUtc(absl::CivilSecond(2026, 3, 8, 3, 0, 0), la)),
		  "2026-03-08T10:00:00.000Z");
}

TEST(ZonedTime, FallBackOverlap)
{
	const auto la = Zone("America/Los_Angeles");

	/* 01:30 occurs twice; the earlier one (PDT) wins */
	EXPECT_EQ(Format(ZonedTimeToUtc(absl::CivilSecond(2026, 11, 1, 1, 30, 0), la)),
		  "2026-11-01T08:30:00.000Z");

	EXPECT_EQ(Format(ZonedTimeToUtc(absl::CivilSecond(2026, 11, 1, 2, 0, 0), la)),
		  "2026-11-01T10:00:00.000Z");
}

TEST(ZonedTime, RoundTrip)
{
	const auto berlin = Zone("Europe/Berlin");

	for (int hour = 0; hour < 24; ++hour) {
		const absl::CivilSecond local(2026, 6, 15, hour, 45, 10);
		const auto t = ZonedTimeToUtc(local, berlin);
		EXPECT_EQ(absl::ToCivilSecond(t, berlin), local);
	}
}

TEST(Calendar, DaysInMonth)
{
	EXPECT_EQ(DaysInMonth(2026, 1), 31U);
	EXPECT_EQ(DaysInMonth(2026, 2), 28U);
	EXPECT_EQ(DaysInMonth(2028, 2), 29U);
	EXPECT_EQ(DaysInMonth(2100, 2), 28U);
	EXPECT_EQ(DaysInMonth(2000, 2), 29U);
	EXPECT_EQ(DaysInMonth(2026, 4), 30U);
	EXPECT_EQ(DaysInMonth(2026, 13), 0U);
	EXPECT_EQ(DaysInMonth(2026, 0), 0U);
}

TEST(ISO8601, Format)
{
	using namespace std::chrono;

	const system_clock::time_point t{seconds{1767628800}};
	EXPECT_EQ(FormatISO8601(t), "2026-01-05T16:00:00.000Z");
	EXPECT_EQ(FormatISO8601(t + milliseconds{5}), "2026-01-05T16:00:00.005Z");
	EXPECT_EQ(FormatISO8601(t + milliseconds{1500}), "2026-01-05T16:00:01.500Z");
}
