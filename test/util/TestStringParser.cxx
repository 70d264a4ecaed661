// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "util/StringParser.hxx"

#include <gtest/gtest.h>

TEST(StringParser, Bool)
{
	EXPECT_TRUE(ParseBool("yes"));
	EXPECT_TRUE(ParseBool("true"));
	EXPECT_FALSE(ParseBool("no"));
	EXPECT_FALSE(ParseBool("false"));
	EXPECT_THROW(ParseBool("1"), std::runtime_error);
	EXPECT_THROW(ParseBool(""), std::runtime_error);
}

TEST(StringParser, UnsignedLong)
{
	EXPECT_EQ(ParseUnsignedLong("0"), 0UL);
	EXPECT_EQ(ParseUnsignedLong(" 42"), 42UL);
	EXPECT_THROW(ParseUnsignedLong("-1"), std::runtime_error);
	EXPECT_THROW(ParseUnsignedLong("4x"), std::runtime_error);
	EXPECT_THROW(ParseUnsignedLong(""), std::runtime_error);
}

TEST(StringParser, PositiveLong)
{
	EXPECT_EQ(ParsePositiveLong("15"), 15UL);
	EXPECT_THROW(ParsePositiveLong("0"), std::runtime_error);
	EXPECT_EQ(ParsePositiveLong("10", 10), 10UL);
	EXPECT_THROW(ParsePositiveLong("11", 10), std::runtime_error);
}
