#pragma once

#include <stdexcept>
#include <string>

namespace headerpipe {
namespace sync {

// Unrecoverable stage failures; the driver decides whether to restart
enum class SyncErrorKind {
  GatewayStopped,     // transport permanently stopped
  SendFailed,         // unclassified send failure
  PendingWatchClosed, // producer of the Empty-count watch is gone
  CapacityWaitFailed, // waiting for send queue capacity failed
};

std::string SyncErrorKindToString(SyncErrorKind kind);

/**
 * SyncError - fatal error surfaced by a pipeline stage
 *
 * kind() lets callers tell failures apart without inspecting what().
 */
class SyncError : public std::runtime_error {
public:
  SyncError(SyncErrorKind kind, const std::string &detail);

  SyncErrorKind kind() const noexcept { return kind_; }

private:
  SyncErrorKind kind_;
};

} // namespace sync
} // namespace headerpipe
