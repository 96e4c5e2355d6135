/**
 * @file shutdown.hpp
 * @brief One-shot "engine stopped" event shared between a Filter and its owners.
 *
 * @details
 * The Filter holds a `ShutdownCoordinator` and completes it exactly once, when
 * `run()`/`tick()` has finished a graceful drain or an immediate stop (or when
 * the Filter is destroyed first). Owners take `ShutdownWatcher` copies from
 * `Filter::get_shutdown_watcher()`, before or after `run()` starts, and block
 * on them from any thread.
 *
 * @code
 * auto done = filter.get_shutdown_watcher();
 * std::thread engine([&] { filter.run(); });
 * filter.cmd_channel()->send(netway::filter_cmd::Shutdown{true});
 * done.wait();
 * engine.join();
 * @endcode
 */
#pragma once

#include <chrono>
#include <future>
#include <mutex>
#include <utility>

namespace netway {

/**
 * @class ShutdownWatcher
 * @brief Read side of the engine's "stopped" event.
 *
 * Copyable. Every copy observes the same event; `wait()` can be called any
 * number of times from any number of threads and returns immediately once
 * the engine has stopped.
 */
class ShutdownWatcher {
public:
  explicit ShutdownWatcher(std::shared_future<void> done) : done_(std::move(done)) {}

  /// Block until the engine has stopped.
  void wait() const { done_.wait(); }

  /// @return true if the engine stopped within `timeout`.
  bool wait_for(std::chrono::milliseconds timeout) const {
    return done_.wait_for(timeout) == std::future_status::ready;
  }

  bool is_done() const { return wait_for(std::chrono::milliseconds(0)); }

private:
  std::shared_future<void> done_;
};

/**
 * @class ShutdownCoordinator
 * @brief Write side: the engine resolves it exactly once when it stops.
 */
class ShutdownCoordinator {
public:
  ShutdownCoordinator();

  ShutdownCoordinator(const ShutdownCoordinator&) = delete;
  ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

  /// Hand out a watcher. Valid before, during and after the engine runs.
  ShutdownWatcher watcher() const { return ShutdownWatcher(done_); }

  /// Resolve the event. Later calls are no-ops; @return true on the first call.
  bool complete();

  bool is_complete() const;

private:
  mutable std::mutex       mutex_;
  std::promise<void>       promise_;
  std::shared_future<void> done_;
  bool                     completed_{false};
};

} // namespace netway
