#pragma once

#include <cstddef>
#include <cstdint>

namespace headerpipe {
namespace protocol {

// Message types - at most 12 bytes
namespace commands {
constexpr const char *GET_BLOCK_HEADERS = "getblockhdrs";
} // namespace commands

constexpr size_t COMMAND_SIZE = 12;

// Block id encoding tags for GET_BLOCK_HEADERS
enum class BlockIdTag : uint8_t {
  NUMBER = 0,
  HASH = 1,
};

constexpr size_t BLOCK_HASH_SIZE = 32;

// Largest header batch a peer will serve in one response
constexpr uint64_t MAX_HEADERS_PER_REQUEST = 1024;

// Default outbound queue depth (messages, not bytes)
constexpr size_t DEFAULT_SEND_QUEUE_CAPACITY = 256;

} // namespace protocol
} // namespace headerpipe
