//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
/**
 @file chrono.hpp

 Standardize chrono time types for this library
 */
#ifndef STAMPEDE_DEFERRED_EXECUTOR_CHRONO
#define STAMPEDE_DEFERRED_EXECUTOR_CHRONO

#include <chrono>

namespace sde {
namespace chrono {

typedef std::chrono::steady_clock::duration duration;
typedef std::chrono::steady_clock::time_point time_point;

/// acquire the current time using the library designated clock
static inline time_point now() {
    return std::chrono::steady_clock::now();
}

/// the largest representable duration, used as an unlimited time budget
static inline constexpr duration forever() {
    return duration::max();
}

/// convenience duration cast
template <typename Duration, typename Rep, typename Period>
inline Duration to(const std::chrono::duration<Rep,Period>& dur) {
    return std::chrono::duration_cast<Duration>(dur);
}

}
}
#endif
