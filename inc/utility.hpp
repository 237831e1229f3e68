//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef STAMPEDE_DEFERRED_EXECUTOR_UTILITY
#define STAMPEDE_DEFERRED_EXECUTOR_UTILITY

#include <cstddef>
#include <limits>
#include <utility>
#include <functional>
#include <type_traits>

namespace sde {

/// type with no qualifiers
template <typename T>
using unqualified = typename std::decay<T>::type;

/// the return type of an arbitrary Callable
template <typename F, typename... Args>
using function_return_type = std::invoke_result_t<F, Args...>;

/// Callable accepting and returning no arguments
typedef std::function<void()> thunk;

/// operation count representing "no limit"
constexpr size_t unlimited_operations = std::numeric_limits<size_t>::max();

}

#endif
