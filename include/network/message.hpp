#pragma once

#include "network/protocol.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace headerpipe {
namespace message {

using BlockNum = uint64_t;
using BlockHash = std::array<uint8_t, protocol::BLOCK_HASH_SIZE>;

/**
 * VarInt - Variable length integer encoding
 */
class VarInt {
public:
  uint64_t value;

  VarInt() : value(0) {}
  explicit VarInt(uint64_t v) : value(v) {}

  // Get encoded size in bytes
  size_t encoded_size() const;

  // Encode to buffer
  size_t encode(uint8_t *buffer) const;

  // Decode from buffer, returns bytes consumed (0 on short or non-canonical input)
  size_t decode(const uint8_t *buffer, size_t available);
};

/**
 * Serialization buffer for building wire-format messages
 */
class MessageSerializer {
public:
  MessageSerializer();

  void write_uint8(uint8_t value);
  void write_uint64(uint64_t value);
  void write_bool(bool value);
  void write_varint(uint64_t value);
  void write_bytes(const uint8_t *data, size_t len);

  const std::vector<uint8_t> &data() const { return buffer_; }
  size_t size() const { return buffer_.size(); }

private:
  std::vector<uint8_t> buffer_;
};

/**
 * Deserialization buffer for parsing wire-format messages
 *
 * Reads past the end set the sticky error flag and return zero values;
 * callers check has_error() once at the end.
 */
class MessageDeserializer {
public:
  MessageDeserializer(const uint8_t *data, size_t size);
  explicit MessageDeserializer(const std::vector<uint8_t> &data);

  uint8_t read_uint8();
  uint64_t read_uint64();
  bool read_bool();
  uint64_t read_varint();
  void read_bytes(uint8_t *out, size_t count);

  size_t bytes_remaining() const { return size_ - position_; }
  size_t position() const { return position_; }
  bool has_error() const { return error_; }

private:
  const uint8_t *data_;
  size_t size_;
  size_t position_;
  bool error_;

  bool check_available(size_t bytes);
};

/**
 * Base class for all message payloads
 */
class Message {
public:
  virtual ~Message() = default;

  // Get command name for this message type
  virtual std::string command() const = 0;

  // Serialize message payload
  virtual std::vector<uint8_t> serialize() const = 0;

  // Deserialize message payload (returns true on success)
  virtual bool deserialize(const uint8_t *data, size_t size) = 0;
};

/**
 * BlockId - starting point of a header request, either a height or a hash
 */
struct BlockId {
  protocol::BlockIdTag tag{protocol::BlockIdTag::NUMBER};
  BlockNum number{0};
  BlockHash hash{};

  static BlockId FromNumber(BlockNum n);
  static BlockId FromHash(const BlockHash &h);

  bool is_number() const { return tag == protocol::BlockIdTag::NUMBER; }

  bool operator==(const BlockId &other) const;
};

/**
 * GETBLOCKHEADERS message - ask one peer for a run of headers
 *
 * request_id is a correlation token chosen by the requester and echoed back
 * in the response; it carries no other meaning.
 */
class GetBlockHeadersMessage : public Message {
public:
  uint64_t request_id{0};
  BlockId start_block;
  uint64_t limit{0};
  uint64_t skip{0};
  bool reverse{false};

  GetBlockHeadersMessage() = default;
  GetBlockHeadersMessage(uint64_t id, BlockId start, uint64_t lim,
                         uint64_t skp = 0, bool rev = false);

  std::string command() const override { return protocol::commands::GET_BLOCK_HEADERS; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

} // namespace message
} // namespace headerpipe
