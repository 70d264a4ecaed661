// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ZonedTime.hxx"

#include <algorithm>
#include <vector>

/**
 * Interpret a civil time as if it were UTC.
 */
static absl::Time
NaiveInstant(absl::CivilSecond cs) noexcept
{
	return absl::FromCivil(cs, absl::UTCTimeZone());
}

absl::Duration
GetZoneOffset(absl::Time t, const absl::TimeZone &tz) noexcept
{
	return NaiveInstant(absl::ToCivilSecond(t, tz)) - t;
}

static void
AddUnique(std::vector<absl::Duration> &v, absl::Duration d) noexcept
{
	if (std::find(v.begin(), v.end(), d) == v.end())
		v.push_back(d);
}

absl::Time
ZonedTimeToUtc(absl::CivilSecond local, const absl::TimeZone &tz) noexcept
{
	const absl::Time guess = NaiveInstant(local);

	std::vector<absl::Duration> offsets;
	offsets.reserve(4);

	const absl::Duration first = GetZoneOffset(guess, tz);
	offsets.push_back(first);

	/* the offset at the first candidate and one hour either side
	   of it catches transitions between "guess" and the actual
	   instant */
	const absl::Time candidate = guess - first;
	AddUnique(offsets, GetZoneOffset(candidate, tz));
	AddUnique(offsets, GetZoneOffset(candidate + absl::Hours(1), tz));
	AddUnique(offsets, GetZoneOffset(candidate - absl::Hours(1), tz));

	struct Candidate {
		absl::Time instant;
		absl::Time rendered;
	};

	std::vector<Candidate> candidates;
	candidates.reserve(offsets.size());
	for (const auto offset : offsets) {
		const absl::Time t = guess - offset;
		candidates.push_back({t, NaiveInstant(absl::ToCivilSecond(t, tz))});
	}

	/* exact match: the earliest one wins */
	const Candidate *match = nullptr;
	for (const auto &i : candidates)
		if (i.rendered == guess &&
		    (match == nullptr || i.instant < match->instant))
			match = &i;

	if (match != nullptr)
		return match->instant;

	/* the requested time falls into a gap; prefer the closest
	   rendering at or after the requested time */
	const Candidate *after = nullptr;
	for (const auto &i : candidates)
		if (i.rendered >= guess &&
		    (after == nullptr || i.rendered < after->rendered ||
		     (i.rendered == after->rendered && i.instant < after->instant)))
			after = &i;

	if (after != nullptr)
		return after->instant;

	const Candidate *closest = &candidates.front();
	for (const auto &i : candidates)
		if (absl::AbsDuration(i.rendered - guess) <
		    absl::AbsDuration(closest->rendered - guess))
			closest = &i;

	return closest->instant;
}
