// -----------------------------------------------------------------------------
// messages.cpp: names for the boundary enums (used in logs and tool output).
// -----------------------------------------------------------------------------
#include "netway/messages.hpp"

namespace netway {

const char* to_string(FilterError e) {
  switch (e) {
    case FilterError::WrongMode:    return "wrong_mode";
    case FilterError::InvalidPhase: return "invalid_phase";
    case FilterError::ShuttingDown: return "shutting_down";
  }
  return "unknown";
}

const char* to_string(FailReason r) {
  switch (r) {
    case FailReason::RetryLimit:  return "retry_limit";
    case FailReason::IdleTimeout: return "idle_timeout";
  }
  return "unknown";
}

} // namespace netway
