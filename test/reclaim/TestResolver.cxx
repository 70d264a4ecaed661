// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "reclaim/Resolver.hxx"
#include "reclaim/Error.hxx"

#include <gtest/gtest.h>

#include <limits>

using namespace Reclaim;

/* 2026-01-05T16:00:00Z */
static constexpr std::chrono::system_clock::time_point now{std::chrono::seconds{1767628800}};

static ResolutionContext
MakeContext(std::string time_zone={})
{
	ResolutionContext context;
	context.time_zone = std::move(time_zone);
	context.now = now;
	return context;
}

static std::string
ResolveString(std::string s, const ResolutionContext &context)
{
	return ResolveToString(TimeExpression{std::move(s)}, context);
}

TEST(Resolver, LocalInZone)
{
	const auto context = MakeContext("America/Los_Angeles");

	EXPECT_EQ(ResolveString("2026-01-05T08:00:00", context),
		  "2026-01-05T16:00:00.000Z");
	EXPECT_EQ(ResolveString("2026-01-05 08:00", context),
		  "2026-01-05T16:00:00.000Z");
	EXPECT_EQ(ResolveString("2026-01-05T08", context),
		  "2026-01-05T16:00:00.000Z");
	EXPECT_EQ(ResolveString("  2026-07-01T12:00:00  ", context),
		  "2026-07-01T19:00:00.000Z");
}

TEST(Resolver, DaylightSavingTransitions)
{
	const auto context = MakeContext("America/Los_Angeles");

	/* skipped hour */
	EXPECT_EQ(ResolveString("2026-03-08T02:30:00", context),
		  "2026-03-08T10:30:00.000Z");

	/* repeated hour: the earlier occurrence */
	EXPECT_EQ(ResolveString("2026-11-01T01:30:00", context),
		  "2026-11-01T08:30:00.000Z");
}

TEST(Resolver, DateOnly)
{
	EXPECT_EQ(ResolveString("2026-01-05", MakeContext("America/Los_Angeles")),
		  "2026-01-05T08:00:00.000Z");
	EXPECT_EQ(ResolveString("2026-01-05", MakeContext("Europe/Berlin")),
		  "2026-01-04T23:00:00.000Z");
	EXPECT_EQ(ResolveString("2026-01-05", MakeContext("UTC")),
		  "2026-01-05T00:00:00.000Z");
}

TEST(Resolver, Milliseconds)
{
	const auto context = MakeContext("UTC");

	EXPECT_EQ(ResolveString("2026-01-05T08:00:00.5", context),
		  "2026-01-05T08:00:00.500Z");
	EXPECT_EQ(ResolveString("2026-01-05T08:00:00.05", context),
		  "2026-01-05T08:00:00.050Z");
	EXPECT_EQ(ResolveString("2026-01-05T08:00:00.123", context),
		  "2026-01-05T08:00:00.123Z");
	EXPECT_THROW(ResolveString("2026-01-05T08:00:00.1234", context),
		     InvalidInput);
	EXPECT_THROW(ResolveString("2026-01-05T08:00:00.", context),
		     InvalidInput);
}

TEST(Resolver, Absolute)
{
	/* the time zone is irrelevant if there is an offset */
	for (const char *tz : {"", "America/Los_Angeles", "Asia/Tokyo"}) {
		const auto context = MakeContext(tz);

		EXPECT_EQ(ResolveString("2026-01-05T16:00:00Z", context),
			  "2026-01-05T16:00:00.000Z");
		EXPECT_EQ(ResolveString("2026-01-05T16:00:00.250z", context),
			  "2026-01-05T16:00:00.250Z");
		EXPECT_EQ(ResolveString("2026-01-05T08:00:00-08:00", context),
			  "2026-01-05T16:00:00.000Z");
		EXPECT_EQ(ResolveString("2026-01-06T01:00:00+09:00", context),
			  "2026-01-05T16:00:00.000Z");
		EXPECT_EQ(ResolveString("2026-01-05T21:30+05:30", context),
			  "2026-01-05T16:00:00.000Z");
	}
}

TEST(Resolver, AbsoluteRanges)
{
	const auto context = MakeContext("UTC");

	EXPECT_THROW(ResolveString("2026-02-30T09:00:00Z", context),
		     InvalidInput);
	EXPECT_THROW(ResolveString("2026-01-05T24:00:00+01:00", context),
		     InvalidInput);

	/* offsets */
	EXPECT_THROW(ResolveString("2026-01-05T08:00:00+99:99", context),
		     InvalidInput);
	EXPECT_THROW(ResolveString("2026-01-05T08:00:00+24:00", context),
		     InvalidInput);
	EXPECT_THROW(ResolveString("2026-01-05T08:00:00-05:60", context),
		     InvalidInput);
	EXPECT_EQ(ResolveString("2026-01-05T08:00:00+23:59", context),
		  "2026-01-04T08:01:00.000Z");
	EXPECT_EQ(ResolveString("2026-01-05T08:00:00-00:30", context),
		  "2026-01-05T08:30:00.000Z");
}

TEST(Resolver, ZonedFallback)
{
	const auto context = MakeContext("Asia/Tokyo");

	EXPECT_EQ(ResolveString("Mon, 05 Jan 2026 08:00:00 -0800", context),
		  "2026-01-05T16:00:00.000Z");
	EXPECT_EQ(ResolveString("05 Jan 2026 16:00:00 +0000", context),
		  "2026-01-05T16:00:00.000Z");
	EXPECT_EQ(ResolveString("2026-01-05 08:00:00 -0800", context),
		  "2026-01-05T16:00:00.000Z");
	EXPECT_EQ(ResolveString("2026-01-05T17:00:00+0100", context),
		  "2026-01-05T16:00:00.000Z");
	EXPECT_EQ(ResolveString("2026-01-05T16:00:00 GMT", context),
		  "2026-01-05T16:00:00.000Z");
	EXPECT_EQ(ResolveString("Mon, 05 Jan 2026 16:00:00 GMT", context),
		  "2026-01-05T16:00:00.000Z");
}

TEST(Resolver, LocalFallback)
{
	const auto context = MakeContext("America/Los_Angeles");

	EXPECT_EQ(ResolveString("2026/01/05 08:00", context),
		  "2026-01-05T16:00:00.000Z");
	EXPECT_EQ(ResolveString("2026/01/05 08:00:30", context),
		  "2026-01-05T16:00:30.000Z");
	EXPECT_EQ(ResolveString("2026/01/05", context),
		  "2026-01-05T08:00:00.000Z");
	EXPECT_EQ(ResolveString("01/05/2026 08:00", context),
		  "2026-01-05T16:00:00.000Z");
	EXPECT_EQ(ResolveString("January 5, 2026 08:00:00", context),
		  "2026-01-05T16:00:00.000Z");
	EXPECT_EQ(ResolveString("January 5, 2026", context),
		  "2026-01-05T08:00:00.000Z");
	EXPECT_EQ(ResolveString("Jan 5 2026", context),
		  "2026-01-05T08:00:00.000Z");
	EXPECT_EQ(ResolveString("5 January 2026 08:00", context),
		  "2026-01-05T16:00:00.000Z");

	/* the time zone rules apply to these, too */
	EXPECT_EQ(ResolveString("2026/03/08 02:30", context),
		  "2026-03-08T10:30:00.000Z");
	EXPECT_EQ(ResolveString("November 1, 2026 01:30", context),
		  "2026-11-01T08:30:00.000Z");
	EXPECT_EQ(ResolveString("2026/07/01 12:00", context),
		  "2026-07-01T19:00:00.000Z");

	EXPECT_THROW(ResolveString("2026/02/30 08:00", context),
		     InvalidInput);

	const auto bad_zone = MakeContext("Not/AZone");
	EXPECT_THROW(ResolveString("2026/01/05 08:00", bad_zone),
		     InvalidTimezone);
}

TEST(Resolver, CalendarRange)
{
	const auto context = MakeContext("America/Los_Angeles");

	EXPECT_THROW(ResolveString("2026-02-30T09:00:00", context),
		     InvalidInput);
	EXPECT_THROW(ResolveString("2026-02-29", context), InvalidInput);
	EXPECT_NO_THROW(ResolveString("2028-02-29", context));
	EXPECT_THROW(ResolveString("2026-13-01", context), InvalidInput);
	EXPECT_THROW(ResolveString("2026-00-10", context), InvalidInput);
	EXPECT_THROW(ResolveString("2026-04-31", context), InvalidInput);
	EXPECT_THROW(ResolveString("2026-01-00", context), InvalidInput);
	EXPECT_THROW(ResolveString("2026-01-05T25:00:00", context),
		     InvalidInput);
	EXPECT_THROW(ResolveString("2026-01-05T23:60:00", context),
		     InvalidInput);
	EXPECT_THROW(ResolveString("2026-01-05T23:00:60", context),
		     InvalidInput);

	try {
		ResolveString("2026-02-30T09:00:00", context);
		FAIL();
	} catch (const InvalidInput &e) {
		EXPECT_NE(std::string_view{e.what()}.find("2026-02"),
			  std::string_view::npos);
	}
}

TEST(Resolver, Malformed)
{
	const auto context = MakeContext("UTC");

	for (const char *s : {"", "tomorrow", "2026-1-5", "2026/13/05",
			      "Febtember 5, 2026", "January 32, 2026",
			      "infinite-future",
			      "2026-01-05T8:00", "2026-01-05X08:00",
			      "2026-01-05T08:00:00 garbage",
			      "2026-01-05T08:00:00+8"})
		EXPECT_THROW(ResolveString(s, context), InvalidInput) << s;
}

TEST(Resolver, InvalidTimezone)
{
	const auto context = MakeContext("Mars/Olympus_Mons");

	EXPECT_THROW(ResolveString("2026-01-05T08:00:00", context),
		     InvalidTimezone);

	/* an absolute date/time does not need the zone */
	EXPECT_EQ(ResolveString("2026-01-05T16:00:00Z", context),
		  "2026-01-05T16:00:00.000Z");

	try {
		LoadZone("Not/AZone");
		FAIL();
	} catch (const InvalidTimezone &e) {
		EXPECT_STREQ(e.what(),
			     "Invalid timeZone \"Not/AZone\". Use an IANA time zone like \"America/Los_Angeles\".");
	}
}

TEST(Resolver, TimeZonePrecedence)
{
	ResolutionContext context;
	context.now = now;
	context.account_time_zone = "Asia/Tokyo";
	EXPECT_EQ(context.GetTimeZoneName(), "Asia/Tokyo");
	EXPECT_EQ(ResolveString("2026-01-05T08:00:00", context),
		  "2026-01-04T23:00:00.000Z");

	context.default_time_zone = "Europe/Berlin";
	EXPECT_EQ(context.GetTimeZoneName(), "Europe/Berlin");
	EXPECT_EQ(ResolveString("2026-01-05T08:00:00", context),
		  "2026-01-05T07:00:00.000Z");

	context.time_zone = " America/Los_Angeles ";
	EXPECT_EQ(context.GetTimeZoneName(), "America/Los_Angeles");
	EXPECT_EQ(ResolveString("2026-01-05T08:00:00", context),
		  "2026-01-05T16:00:00.000Z");

	/* blank values are skipped */
	context.time_zone = "  ";
	EXPECT_EQ(context.GetTimeZoneName(), "Europe/Berlin");

	ResolutionContext empty;
	EXPECT_TRUE(empty.GetTimeZoneName().empty());
}

TEST(Resolver, RelativeDays)
{
	const auto context = MakeContext("America/Los_Angeles");

	EXPECT_EQ(ResolveToString(RelativeDays{1}, context),
		  "2026-01-06T16:00:00.000Z");
	EXPECT_EQ(ResolveToString(RelativeDays{7}, context),
		  "2026-01-12T16:00:00.000Z");

	/* non-positive values mean "now" */
	EXPECT_EQ(Resolve(RelativeDays{0}, context), now);
	EXPECT_EQ(Resolve(RelativeDays{-3}, context), now);

	/* absurdly large counts are rejected instead of overflowing */
	EXPECT_NO_THROW(Resolve(RelativeDays{36600}, context));
	EXPECT_THROW(Resolve(RelativeDays{36601}, context), InvalidInput);
	EXPECT_THROW(Resolve(RelativeDays{200000000000L}, context),
		     InvalidInput);
	EXPECT_THROW(Resolve(RelativeDays{std::numeric_limits<long>::max()},
			     context),
		     InvalidInput);
}

TEST(Resolver, RelativeDaysAcrossDst)
{
	/* 2026-03-05T08:00:00 in Los Angeles (PST) */
	auto context = MakeContext("America/Los_Angeles");
	context.now = std::chrono::system_clock::time_point{std::chrono::seconds{1772726400}};

	/* a fixed 24 hour shift: after the switch to PDT on
	   2026-03-08, the wall clock reads 09:00 */
	EXPECT_EQ(ResolveToString(RelativeDays{5}, context),
		  "2026-03-10T16:00:00.000Z");
	EXPECT_NE(ResolveToString(RelativeDays{5}, context),
		  ResolveString("2026-03-10T08:00:00", context));
	EXPECT_EQ(ResolveString("2026-03-10T09:00:00", context),
		  "2026-03-10T16:00:00.000Z");
}
