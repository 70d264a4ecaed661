// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LineParser.hxx"
#include "util/StringParser.hxx"

#include <string.h>

bool
LineParser::SkipWord(const char *word) noexcept
{
	const std::size_t length = strlen(word);
	if (strncmp(p, word, length) != 0)
		return false;

	if (p[length] != 0 && !IsWhitespaceNotNull(p[length]))
		return false;

	p += length;
	Strip();
	return true;
}

const char *
LineParser::NextWord() noexcept
{
	if (!IsWordChar(front()))
		return nullptr;

	const char *result = p;
	do {
		++p;
	} while (IsWordChar(front()));

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd()) {
		/* no separator: leave the rest for the caller's
		   error handling */
		return nullptr;
	}

	return result;
}

char *
LineParser::NextUnquotedValue() noexcept
{
	if (!IsUnquotedChar(front()))
		return nullptr;

	char *result = p;
	do {
		++p;
	} while (IsUnquotedChar(front()));

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		return nullptr;

	return result;
}

char *
LineParser::NextQuotedValue(char stop)
{
	char *result = p;
	char *end = strchr(p, stop);
	if (end == nullptr)
		throw Error("Missing closing quote");

	*end = 0;
	p = end + 1;
	Strip();
	return result;
}

char *
LineParser::NextValue()
{
	const char ch = front();
	if (IsQuote(ch)) {
		++p;
		return NextQuotedValue(ch);
	}

	return NextUnquotedValue();
}

bool
LineParser::NextBool()
{
	const char *value = NextValue();
	if (value == nullptr)
		throw Error("yes/no expected");

	return ParseBool(value);
}

unsigned
LineParser::NextPositiveInteger()
{
	const char *value = NextValue();
	if (value == nullptr)
		throw Error("Positive integer expected");

	return ParsePositiveLong(value, ~0U);
}

const char *
LineParser::ExpectWord()
{
	const char *value = NextWord();
	if (value == nullptr)
		throw Error("Word expected");

	return value;
}

char *
LineParser::ExpectValue()
{
	char *value = NextValue();
	if (value == nullptr || *value == 0)
		throw Error("Value expected");

	return value;
}

char *
LineParser::ExpectValueAndEnd()
{
	char *value = ExpectValue();
	ExpectEnd();
	return value;
}
