// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Compat.hxx"
#include "util/BindMethod.hxx"

#include <exception>
#include <utility>

namespace Co {

/**
 * A helper task which invokes a coroutine from synchronous code.  It
 * starts running immediately; the completion callback receives the
 * exception thrown by the coroutine (or nullptr on success).
 *
 * Destroying an unfinished #InvokeTask cancels the coroutine.
 */
class InvokeTask {
	using Callback = BoundMethod<void(std::exception_ptr error) noexcept>;

public:
	struct promise_type {
		Callback callback{nullptr};

		std::exception_ptr error;

		auto initial_suspend() noexcept {
			return std::suspend_never{};
		}

		struct final_awaitable {
			bool await_ready() const noexcept {
				return false;
			}

			template<typename PROMISE>
			void await_suspend(std::coroutine_handle<PROMISE> coro) noexcept {
				auto &p = coro.promise();
				if (p.callback)
					p.callback(std::move(p.error));
			}

			void await_resume() const noexcept {
			}
		};

		auto final_suspend() noexcept {
			return final_awaitable{};
		}

		void return_void() noexcept {
		}

		InvokeTask get_return_object() noexcept {
			return InvokeTask(std::coroutine_handle<promise_type>::from_promise(*this));
		}

		void unhandled_exception() noexcept {
			error = std::current_exception();
		}
	};

private:
	std::coroutine_handle<promise_type> coroutine;

	explicit InvokeTask(std::coroutine_handle<promise_type> _coroutine) noexcept
		:coroutine(_coroutine)
	{
	}

public:
	InvokeTask() noexcept {
	}

	InvokeTask(InvokeTask &&src) noexcept
		:coroutine(std::exchange(src.coroutine, nullptr))
	{
	}

	~InvokeTask() noexcept {
		if (coroutine)
			coroutine.destroy();
	}

	InvokeTask &operator=(InvokeTask &&src) noexcept {
		using std::swap;
		swap(coroutine, src.coroutine);
		return *this;
	}

	operator bool() const noexcept {
		return (bool)coroutine;
	}

	bool done() const noexcept {
		return coroutine && coroutine.done();
	}

	/**
	 * Register the completion callback.  If the coroutine has
	 * already finished, the callback is invoked right away.
	 */
	void OnCompletion(Callback callback) noexcept {
		if (coroutine.done())
			callback(std::move(coroutine.promise().error));
		else
			coroutine.promise().callback = callback;
	}
};

} // namespace Co
