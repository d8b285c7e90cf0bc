// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <type_traits>
#include <utility>

/**
 * A function pointer wrapping a method plus a pointer to the
 * instance it shall be invoked on.  This is how event sources and
 * asynchronous operations report back to their owner without
 * std::function overhead.
 *
 * @param S the plain function signature type
 */
template<typename S=void()>
class BoundMethod;

template<typename R, bool NoExcept, typename... Args>
class BoundMethod<R(Args...) noexcept(NoExcept)> {
	using function_pointer = R (*)(void *instance, Args... args) noexcept(NoExcept);

	void *instance_;
	function_pointer function;

public:
	BoundMethod() = default;

	constexpr BoundMethod(void *_instance,
			      function_pointer _function) noexcept
		:instance_(_instance), function(_function) {}

	/**
	 * Construct an "undefined" object.  It must not be called.
	 */
	constexpr BoundMethod(std::nullptr_t) noexcept
		:instance_(nullptr), function(nullptr) {}

	constexpr operator bool() const noexcept {
		return function != nullptr;
	}

	R operator()(Args... args) const noexcept(NoExcept) {
		return function(instance_, std::forward<Args>(args)...);
	}
};

namespace BindMethodDetail {

template<typename M>
struct SignatureHelper;

template<typename R, bool NoExcept, typename T, typename... Args>
struct SignatureHelper<R (T::*)(Args...) noexcept(NoExcept)> {
	using class_type = T;
	using plain_signature = R(Args...) noexcept(NoExcept);
	using function_pointer = R (*)(void *, Args...) noexcept(NoExcept);
};

template<typename R, bool NoExcept, typename... Args>
struct SignatureHelper<R (*)(Args...) noexcept(NoExcept)> {
	using plain_signature = R(Args...) noexcept(NoExcept);
	using function_pointer = R (*)(void *, Args...) noexcept(NoExcept);
};

template<typename M, auto method>
struct WrapperGenerator;

template<typename T, bool NoExcept,
	 auto method, typename R, typename... Args>
struct WrapperGenerator<R (T::*)(Args...) noexcept(NoExcept), method> {
	static R Invoke(void *_instance, Args... args) noexcept(NoExcept) {
		auto &t = *static_cast<T *>(_instance);
		return (t.*method)(std::forward<Args>(args)...);
	}
};

template<auto function, bool NoExcept, typename R, typename... Args>
struct WrapperGenerator<R (*)(Args...) noexcept(NoExcept), function> {
	static R Invoke(void *, Args... args) noexcept(NoExcept) {
		return function(std::forward<Args>(args)...);
	}
};

} // namespace BindMethodDetail

template<auto method>
constexpr auto
BindMethod(typename BindMethodDetail::SignatureHelper<decltype(method)>::class_type &instance) noexcept
{
	using H = BindMethodDetail::SignatureHelper<decltype(method)>;
	typename H::function_pointer f =
		BindMethodDetail::WrapperGenerator<decltype(method), method>::Invoke;
	return BoundMethod<typename H::plain_signature>{&instance, f};
}

template<auto function>
constexpr auto
BindFunction() noexcept
{
	using H = BindMethodDetail::SignatureHelper<decltype(function)>;
	typename H::function_pointer f =
		BindMethodDetail::WrapperGenerator<decltype(function), function>::Invoke;
	return BoundMethod<typename H::plain_signature>{nullptr, f};
}

#define BIND_METHOD(instance, method) \
	BindMethod<method>(instance)

/**
 * Shortcut for BIND_METHOD() which binds "*this".
 */
#define BIND_THIS_METHOD(method) \
	BIND_METHOD(*this, &std::remove_reference_t<decltype(*this)>::method)

#define BIND_FUNCTION(function) \
	BindFunction<&function>()
