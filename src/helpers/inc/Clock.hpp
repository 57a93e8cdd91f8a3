#ifndef VITALS_HELPERS_CLOCK_HPP
#define VITALS_HELPERS_CLOCK_HPP
/**
 * @file Clock.hpp
 * @brief Injectable wait used by samplers.
 */

#include <chrono>
#include <functional>
#include <thread>

namespace vitals {
namespace helpers {
namespace clock {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Wait primitive used between samples.
 *
 * The default blocks the calling thread. A cooperative scheduler supplies a
 * callable that suspends the current task instead; tests supply a no-op.
 */
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/* ----------------------------- API ----------------------------- */

/// Sleeper that blocks the calling thread.
[[nodiscard]] inline Sleeper threadSleeper() {
  return [](std::chrono::milliseconds interval) { std::this_thread::sleep_for(interval); };
}

} // namespace clock
} // namespace helpers
} // namespace vitals

#endif // VITALS_HELPERS_CLOCK_HPP
