// -----------------------------------------------------------------------------
// shutdown.cpp: one-shot "engine stopped" event.
// -----------------------------------------------------------------------------
#include "netway/shutdown.hpp"

namespace netway {

ShutdownCoordinator::ShutdownCoordinator()
: done_(promise_.get_future().share()) {}

bool ShutdownCoordinator::complete() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (completed_) return false;     // promise may only be satisfied once
  completed_ = true;
  promise_.set_value();
  return true;
}

bool ShutdownCoordinator::is_complete() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return completed_;
}

} // namespace netway
