#include "network/gateway.hpp"
#include <stdexcept>

namespace headerpipe {
namespace network {

std::string SendResultToString(SendResult result) {
  switch (result) {
  case SendResult::OK:
    return "ok";
  case SendResult::QUEUE_FULL:
    return "send queue full";
  case SendResult::STOPPED:
    return "gateway stopped";
  case SendResult::FAILED:
    return "send failed";
  }
  return "unknown";
}

std::string PeerFilter::ToString() const {
  switch (kind) {
  case Kind::ALL:
    return "all";
  case Kind::RANDOM:
    return "random(" + std::to_string(count) + ")";
  case Kind::PEER_ID:
    return "peer(" + std::to_string(peer_id) + ")";
  }
  return "unknown";
}

SharedGateway::SharedGateway(std::shared_ptr<Gateway> gateway)
    : gateway_(std::move(gateway)) {
  if (!gateway_) {
    throw std::invalid_argument("SharedGateway requires a gateway");
  }
}

void SharedGateway::Reset(std::shared_ptr<Gateway> gateway) {
  if (!gateway) {
    throw std::invalid_argument("SharedGateway requires a gateway");
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  gateway_ = std::move(gateway);
}

} // namespace network
} // namespace headerpipe
