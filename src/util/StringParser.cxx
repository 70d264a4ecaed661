// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringParser.hxx"
#include "StringStrip.hxx"

#include <cstdlib>
#include <stdexcept>

#include <string.h>

bool
ParseBool(const char *s)
{
	if (strcmp(s, "yes") == 0 || strcmp(s, "true") == 0)
		return true;
	else if (strcmp(s, "no") == 0 || strcmp(s, "false") == 0)
		return false;
	else
		throw std::runtime_error("Failed to parse boolean; \"yes\" or \"no\" expected");
}

unsigned long
ParseUnsignedLong(const char *s)
{
	s = StripLeft(s);
	if (*s == '-')
		throw std::runtime_error("Value must not be negative");

	char *endptr;
	auto value = std::strtoul(s, &endptr, 10);
	if (endptr == s || *endptr != 0)
		throw std::runtime_error("Failed to parse integer");

	return value;
}

unsigned long
ParsePositiveLong(const char *s)
{
	auto value = ParseUnsignedLong(s);
	if (value <= 0)
		throw std::runtime_error("Value must be positive");

	return value;
}

unsigned long
ParsePositiveLong(const char *s, unsigned long max_value)
{
	auto value = ParsePositiveLong(s);
	if (value > max_value)
		throw std::runtime_error("Value is too large");

	return value;
}
