// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "reclaim/AccountCache.hxx"
#include "reclaim/AccountDefaults.hxx"
#include "reclaim/RecordService.hxx"
#include "../co/PauseTask.hxx"
#include "../co/RunTask.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace Reclaim;
using json = nlohmann::json;

static const json sample_user = {
	{"id", "u1"},
	{"timezone", "America/Los_Angeles"},
	{"features", {
			{"taskSettings", {
					{"defaults", {
							{"timeChunksRequired", 4},
							{"minChunkSize", 2},
							{"maxChunkSize", 8},
							{"dueInDays", 5},
							{"priority", "P2"},
							{"eventCategory", "personal"},
							{"alwaysPrivate", true},
							{"onDeck", false},
							{"timeSchemeId", "abc"},
						}},
				}},
		}},
};

TEST(AccountDefaults, FromUser)
{
	const auto d = AccountDefaults::FromUser(sample_user);
	EXPECT_EQ(d.time_zone, "America/Los_Angeles");
	EXPECT_EQ(d.time_chunks_required, 4U);
	EXPECT_EQ(d.min_chunk_size, 2U);
	EXPECT_EQ(d.max_chunk_size, 8U);
	EXPECT_EQ(d.due_in_days, 5U);
	EXPECT_EQ(d.priority, "P2");
	EXPECT_EQ(d.category, "PERSONAL");
	EXPECT_FALSE(d.sub_type);
	EXPECT_EQ(d.always_private, true);
	EXPECT_EQ(d.on_deck, false);
	EXPECT_EQ(d.time_scheme_id, "abc");

	const auto j = d.ToJson();
	EXPECT_EQ(j.at("timeZone"), "America/Los_Angeles");
	EXPECT_EQ(j.at("taskDefaults").at("dueInDays"), 5);
}

TEST(AccountDefaults, Malformed)
{
	const json user = {
		{"settings", {{"timezone", "Europe/Berlin"}}},
		{"features", {
				{"taskSettings", {
						{"defaults", {
								{"timeChunksRequired", -1},
								{"minChunkSize", "2"},
								{"priority", "P9"},
								{"alwaysPrivate", "yes"},
							}},
					}},
			}},
	};

	const auto d = AccountDefaults::FromUser(user);
	EXPECT_EQ(d.time_zone, "Europe/Berlin");
	EXPECT_FALSE(d.time_chunks_required);
	EXPECT_FALSE(d.min_chunk_size);
	EXPECT_FALSE(d.priority);
	EXPECT_FALSE(d.always_private);
}

TEST(AccountDefaults, Empty)
{
	const auto d = AccountDefaults::FromUser(json::object());
	EXPECT_TRUE(d.time_zone.empty());
	EXPECT_FALSE(d.category);
	EXPECT_EQ(d.raw, json::object());

	EXPECT_EQ(d.ToJson(), (json{{"taskDefaults", json::object()}}));
}

namespace {

class FakeAccountSource final : public AccountInfoSource {
public:
	Co::PauseTask *pause = nullptr;
	unsigned n_calls = 0;
	bool fail = false;

	Co::Task<json> FetchCurrentUser() override {
		++n_calls;

		if (pause != nullptr)
			co_await *pause;

		if (fail)
			throw std::runtime_error("401 Unauthorized");

		co_return sample_user;
	}
};

} // anonymous namespace

static Co::InvokeTask
GetTimeZone(AccountCache &cache, std::string &time_zone_r)
{
	const auto defaults = co_await cache.GetOrEmpty();
	time_zone_r = defaults.time_zone;
}

TEST(AccountCache, FetchOnce)
{
	FakeAccountSource source;
	AccountCache cache{source};
	EXPECT_FALSE(cache.IsReady());

	EXPECT_EQ(RunTask(cache.Get()).time_zone, "America/Los_Angeles");
	EXPECT_TRUE(cache.IsReady());
	EXPECT_EQ(RunTask(cache.GetOrEmpty()).priority, "P2");
	EXPECT_EQ(source.n_calls, 1U);
}

TEST(AccountCache, Concurrent)
{
	Co::PauseTask pause;
	FakeAccountSource source;
	source.pause = &pause;
	AccountCache cache{source};

	std::string tz[3];
	Completion completions[3];
	Co::InvokeTask tasks[3];

	for (unsigned i = 0; i < 3; ++i) {
		tasks[i] = GetTimeZone(cache, tz[i]);
		completions[i].Start(tasks[i]);
	}

	EXPECT_EQ(source.n_calls, 1U);
	EXPECT_FALSE(completions[0].done);

	pause.Resume();

	for (unsigned i = 0; i < 3; ++i) {
		EXPECT_TRUE(completions[i].done);
		EXPECT_FALSE(completions[i].error);
		EXPECT_EQ(tz[i], "America/Los_Angeles");
	}

	EXPECT_EQ(source.n_calls, 1U);
}

TEST(AccountCache, Failure)
{
	FakeAccountSource source;
	source.fail = true;
	AccountCache cache{source};

	EXPECT_THROW(RunTask(cache.Get()), std::runtime_error);

	/* the failure is remembered; GetOrEmpty() hides it */
	source.fail = false;
	const auto d = RunTask(cache.GetOrEmpty());
	EXPECT_TRUE(d.time_zone.empty());
	EXPECT_FALSE(d.priority);
	EXPECT_EQ(source.n_calls, 1U);
}
