// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

/**
 * Gregorian calendar arithmetic.
 */

constexpr bool
IsLeapYear(int year) noexcept
{
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

/**
 * @param month the month (1-12)
 * @return the number of days in the given month, or 0 if the month
 * is out of range
 */
constexpr unsigned
DaysInMonth(int year, unsigned month) noexcept
{
	switch (month) {
	case 1:
	case 3:
	case 5:
	case 7:
	case 8:
	case 10:
	case 12:
		return 31;

	case 4:
	case 6:
	case 9:
	case 11:
		return 30;

	case 2:
		return IsLeapYear(year) ? 29 : 28;

	default:
		return 0;
	}
}
