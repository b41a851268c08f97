#include "sync/sync_error.hpp"

namespace headerpipe {
namespace sync {

std::string SyncErrorKindToString(SyncErrorKind kind) {
  switch (kind) {
  case SyncErrorKind::GatewayStopped:
    return "gateway stopped";
  case SyncErrorKind::SendFailed:
    return "send failed";
  case SyncErrorKind::PendingWatchClosed:
    return "pending watch closed";
  case SyncErrorKind::CapacityWaitFailed:
    return "capacity wait failed";
  }
  return "unknown";
}

SyncError::SyncError(SyncErrorKind kind, const std::string &detail)
    : std::runtime_error(SyncErrorKindToString(kind) + ": " + detail),
      kind_(kind) {}

} // namespace sync
} // namespace headerpipe
