// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "reclaim/TaskFilter.hxx"

#include <gtest/gtest.h>

using namespace Reclaim;
using json = nlohmann::json;

TEST(TaskFilter, IsActive)
{
	EXPECT_TRUE(IsActiveTask({{"id", 1}, {"status", "NEW"}}));
	EXPECT_TRUE(IsActiveTask({{"id", 1}, {"status", "SCHEDULED"}}));
	EXPECT_TRUE(IsActiveTask({{"id", 1}, {"status", "IN_PROGRESS"}}));

	/* "COMPLETE" only means the scheduled time is used up */
	EXPECT_TRUE(IsActiveTask({{"id", 1}, {"status", "COMPLETE"}}));

	EXPECT_TRUE(IsActiveTask({{"id", 1}}));
	EXPECT_TRUE(IsActiveTask({{"id", 1}, {"deleted", false}}));

	EXPECT_FALSE(IsActiveTask({{"id", 1}, {"status", "ARCHIVED"}}));
	EXPECT_FALSE(IsActiveTask({{"id", 1}, {"status", "CANCELLED"}}));
	EXPECT_FALSE(IsActiveTask({{"id", 1}, {"status", "NEW"}, {"deleted", true}}));
	EXPECT_FALSE(IsActiveTask(json{}));
	EXPECT_FALSE(IsActiveTask(json::array()));
}

TEST(TaskFilter, Filter)
{
	const json tasks = json::array({
			{{"id", 1}, {"status", "NEW"}},
			{{"id", 2}, {"status", "ARCHIVED"}},
			{{"id", 3}, {"status", "COMPLETE"}},
			{{"id", 4}, {"status", "SCHEDULED"}, {"deleted", true}},
			{{"id", 5}, {"status", "CANCELLED"}},
		});

	const auto result = FilterActiveTasks(tasks);
	ASSERT_TRUE(result.is_array());
	ASSERT_EQ(result.size(), 2U);
	EXPECT_EQ(result[0].at("id"), 1);
	EXPECT_EQ(result[1].at("id"), 3);

	EXPECT_EQ(FilterActiveTasks(json{{"tasks", tasks}}), json::array());
	EXPECT_EQ(FilterActiveTasks(json::array()), json::array());
}
