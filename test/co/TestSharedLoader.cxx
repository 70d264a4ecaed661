// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "PauseTask.hxx"
#include "RunTask.hxx"
#include "co/SharedLoader.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

namespace {

struct Counter {
	Co::PauseTask *pause = nullptr;
	unsigned n_calls = 0;
	bool fail = false;

	Co::Task<int> Load() {
		++n_calls;

		if (pause != nullptr)
			co_await *pause;

		if (fail)
			throw std::runtime_error("load failed");

		co_return 42;
	}
};

} // anonymous namespace

static Co::InvokeTask
Waiter(Co::SharedLoader<int> &loader, Counter &counter,
       std::optional<int> &value_r)
{
	value_r = co_await loader.Get([&counter]{ return counter.Load(); });
}

TEST(SharedLoader, Synchronous)
{
	Counter counter;
	Co::SharedLoader<int> loader;
	EXPECT_FALSE(loader.IsReady());
	EXPECT_EQ(loader.GetIfReady(), nullptr);

	EXPECT_EQ(RunTask(loader.Get([&counter]{ return counter.Load(); })), 42);
	EXPECT_TRUE(loader.IsReady());
	EXPECT_FALSE(loader.IsLoading());
	EXPECT_EQ(counter.n_calls, 1U);

	EXPECT_EQ(RunTask(loader.Get([&counter]{ return counter.Load(); })), 42);
	EXPECT_EQ(counter.n_calls, 1U);

	ASSERT_NE(loader.GetIfReady(), nullptr);
	EXPECT_EQ(*loader.GetIfReady(), 42);
}

TEST(SharedLoader, Concurrent)
{
	Co::PauseTask pause;
	Counter counter{.pause = &pause};
	Co::SharedLoader<int> loader;

	std::optional<int> values[3];
	Completion completions[3];

	auto w0 = Waiter(loader, counter, values[0]);
	completions[0].Start(w0);
	auto w1 = Waiter(loader, counter, values[1]);
	completions[1].Start(w1);

	EXPECT_TRUE(pause.IsAwaited());
	EXPECT_TRUE(loader.IsLoading());
	EXPECT_FALSE(values[0]);
	EXPECT_FALSE(values[1]);
	EXPECT_EQ(counter.n_calls, 1U);

	pause.Resume();

	EXPECT_TRUE(completions[0].done);
	EXPECT_TRUE(completions[1].done);
	ASSERT_TRUE(values[0]);
	ASSERT_TRUE(values[1]);
	EXPECT_EQ(*values[0], 42);
	EXPECT_EQ(*values[1], 42);

	/* a late caller gets the stored value */
	auto w2 = Waiter(loader, counter, values[2]);
	completions[2].Start(w2);
	EXPECT_TRUE(completions[2].done);
	ASSERT_TRUE(values[2]);
	EXPECT_EQ(*values[2], 42);

	EXPECT_EQ(counter.n_calls, 1U);
}

TEST(SharedLoader, Error)
{
	Counter counter{.fail = true};
	Co::SharedLoader<int> loader;

	EXPECT_THROW(RunTask(loader.Get([&counter]{ return counter.Load(); })),
		     std::runtime_error);
	EXPECT_TRUE(loader.IsReady());
	EXPECT_EQ(loader.GetIfReady(), nullptr);

	/* the error is remembered; the loader is not invoked again */
	counter.fail = false;
	EXPECT_THROW(RunTask(loader.Get([&counter]{ return counter.Load(); })),
		     std::runtime_error);
	EXPECT_EQ(counter.n_calls, 1U);
}

TEST(SharedLoader, ConcurrentError)
{
	Co::PauseTask pause;
	Counter counter{.pause = &pause, .fail = true};
	Co::SharedLoader<int> loader;

	std::optional<int> values[2];
	Completion completions[2];

	auto w0 = Waiter(loader, counter, values[0]);
	completions[0].Start(w0);
	auto w1 = Waiter(loader, counter, values[1]);
	completions[1].Start(w1);

	pause.Resume();

	EXPECT_TRUE(completions[0].done);
	EXPECT_TRUE(completions[1].done);
	EXPECT_TRUE(completions[0].error);
	EXPECT_TRUE(completions[1].error);
	EXPECT_FALSE(values[0]);
	EXPECT_FALSE(values[1]);
	EXPECT_EQ(counter.n_calls, 1U);
}

TEST(SharedLoader, Inject)
{
	Counter counter;
	Co::SharedLoader<int> loader;
	loader.InjectValue(7);

	EXPECT_EQ(RunTask(loader.Get([&counter]{ return counter.Load(); })), 7);
	EXPECT_EQ(counter.n_calls, 0U);
}
