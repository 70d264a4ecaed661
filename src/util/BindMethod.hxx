// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <type_traits>
#include <utility>

/**
 * A non-owning reference to a method of a specific object, bound at
 * compile time.  It is cheaper than std::function because it does not
 * allocate and consists of just two pointers.
 *
 * Construct instances with BIND_METHOD() or BIND_THIS_METHOD().
 */
template<typename S>
class BoundMethod;

template<typename R, typename... Args>
class BoundMethod<R(Args...) noexcept> {
	using function_pointer = R (*)(void *, Args...) noexcept;

	void *instance_;
	function_pointer function;

public:
	BoundMethod() = default;

	constexpr BoundMethod(std::nullptr_t) noexcept
		:instance_(nullptr), function(nullptr) {}

	constexpr BoundMethod(void *_instance,
			      function_pointer _function) noexcept
		:instance_(_instance), function(_function) {}

	constexpr operator bool() const noexcept {
		return function != nullptr;
	}

	R operator()(Args... args) const noexcept {
		return function(instance_, std::forward<Args>(args)...);
	}
};

namespace BindMethodDetail {

template<typename M>
struct MethodTraits;

template<typename T, typename R, typename... Args>
struct MethodTraits<R (T::*)(Args...) noexcept> {
	using Signature = R(Args...) noexcept;

	template<auto method>
	static R Invoke(void *instance, Args... args) noexcept {
		return (static_cast<T *>(instance)->*method)(std::forward<Args>(args)...);
	}
};

template<auto method, typename T>
constexpr auto
Bind(T &instance) noexcept
{
	using Traits = MethodTraits<decltype(method)>;
	return BoundMethod<typename Traits::Signature>{
		static_cast<void *>(&instance),
		&Traits::template Invoke<method>,
	};
}

} // namespace BindMethodDetail

#define BIND_METHOD(instance, method) \
	BindMethodDetail::Bind<method>(instance)

#define BIND_THIS_METHOD(method) \
	BIND_METHOD(*this, &std::remove_reference_t<decltype(*this)>::method)
