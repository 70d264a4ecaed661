// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Task.hxx"
#include "InvokeTask.hxx"

#include <cassert>
#include <concepts>
#include <exception>
#include <variant>
#include <vector>

namespace Co {

/**
 * Loads a value exactly once, in a coroutine, and shares it with all
 * callers.  The first Get() call starts the loader function; callers
 * arriving while the load is in flight are suspended and resumed
 * when it finishes; later callers get the stored value (or the stored
 * exception) immediately.
 *
 * The object must outlive all pending Get() calls.
 */
template<typename T>
class SharedLoader {
	std::variant<std::monostate, T, std::exception_ptr> value;

	/**
	 * The coroutine running the loader function.
	 */
	InvokeTask loader;

	/**
	 * Coroutines waiting for the loader to finish.
	 */
	std::vector<std::coroutine_handle<>> waiters;

	struct Awaitable final {
		SharedLoader &shared;

		bool await_ready() const noexcept {
			return shared.IsReady();
		}

		void await_suspend(std::coroutine_handle<> continuation) {
			shared.waiters.push_back(continuation);
		}

		void await_resume() const noexcept {
			assert(shared.IsReady());
		}
	};

public:
	SharedLoader() = default;

	~SharedLoader() noexcept {
		assert(waiters.empty());
	}

	SharedLoader(const SharedLoader &) = delete;
	SharedLoader &operator=(const SharedLoader &) = delete;

	/**
	 * Has the value (or an error) been stored already?
	 */
	bool IsReady() const noexcept {
		return !std::holds_alternative<std::monostate>(value);
	}

	/**
	 * Is the loader function currently running?
	 */
	bool IsLoading() const noexcept {
		return loader && !IsReady();
	}

	/**
	 * Return the stored value without suspending, or nullptr if
	 * it is not (yet) available.
	 */
	const T *GetIfReady() const noexcept {
		return std::get_if<T>(&value);
	}

	/**
	 * Obtain the value.
	 *
	 * @param f a function returning a #Co::Task<T>; it is invoked
	 * at most once during the lifetime of this object
	 */
	template<std::invocable F>
	Task<T> Get(F f) {
		if (!IsReady()) {
			if (!loader) {
				loader = Load(std::move(f));
				loader.OnCompletion(BIND_THIS_METHOD(OnLoaded));
			}

			co_await Awaitable{*this};
		}

		if (const auto *e = std::get_if<std::exception_ptr>(&value))
			std::rethrow_exception(*e);

		co_return std::get<T>(value);
	}

	/**
	 * Store a value without invoking a loader.  This is only
	 * allowed before the first Get() call.
	 */
	template<typename... Args>
	void InjectValue(Args&&... args) noexcept {
		assert(!IsReady());
		assert(!loader);

		value.template emplace<T>(std::forward<Args>(args)...);
	}

private:
	template<typename F>
	InvokeTask Load(F f) {
		try {
			T result = co_await f();
			value.template emplace<T>(std::move(result));
		} catch (...) {
			value.template emplace<std::exception_ptr>(std::current_exception());
		}
	}

	void OnLoaded(std::exception_ptr) noexcept {
		assert(IsReady());

		/* move the list to the stack, because a resumed
		   coroutine may call Get() again */
		auto tmp = std::move(waiters);
		waiters.clear();

		for (auto i : tmp)
			i.resume();
	}
};

} // namespace Co
