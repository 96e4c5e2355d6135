/**
 * @file clock.hpp
 * @brief Time source for the Filter: the real steady clock, or one you advance by hand.
 *
 * @details
 * Every time-dependent decision in the Filter (retry age, keep-alive, idle
 * timeout, shutdown drain deadline) reads `Clock::now()` and nothing else.
 * Production code passes `SteadyClock`; tests pass `ManualClock` and call
 * `advance()` between `Filter::tick()` calls, so retry behavior is exact and
 * never depends on scheduler timing.
 */
#ifndef NETWAY_CLOCK_HPP
#define NETWAY_CLOCK_HPP

#include <chrono>
#include <memory>
#include <mutex>

namespace netway {

using TimePoint    = std::chrono::steady_clock::time_point;
using Milliseconds = std::chrono::milliseconds;

class Clock {
public:
  virtual ~Clock() = default;
  virtual TimePoint now() const = 0;
};

class SteadyClock : public Clock {
public:
  TimePoint now() const override { return std::chrono::steady_clock::now(); }
};

/// Starts at the steady clock's current reading and only moves on advance().
class ManualClock : public Clock {
public:
  ManualClock() : now_(std::chrono::steady_clock::now()) {}

  TimePoint now() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
  }

  void advance(Milliseconds by) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += by;
  }

private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

} // namespace netway

#endif // NETWAY_CLOCK_HPP
