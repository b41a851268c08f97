#include "network/message.hpp"
#include "util/endian.hpp"
#include <cstring>

namespace headerpipe {
namespace message {

// VarInt implementation
size_t VarInt::encoded_size() const {
  if (value < 0xfd)
    return 1;
  if (value <= 0xffff)
    return 3;
  if (value <= 0xffffffff)
    return 5;
  return 9;
}

size_t VarInt::encode(uint8_t *buffer) const {
  if (value < 0xfd) {
    buffer[0] = static_cast<uint8_t>(value);
    return 1;
  } else if (value <= 0xffff) {
    buffer[0] = 0xfd;
    endian::WriteLE16(buffer + 1, static_cast<uint16_t>(value));
    return 3;
  } else if (value <= 0xffffffff) {
    buffer[0] = 0xfe;
    endian::WriteLE32(buffer + 1, static_cast<uint32_t>(value));
    return 5;
  }
  buffer[0] = 0xff;
  endian::WriteLE64(buffer + 1, value);
  return 9;
}

size_t VarInt::decode(const uint8_t *buffer, size_t available) {
  if (available < 1)
    return 0;

  uint8_t first = buffer[0];
  if (first < 0xfd) {
    value = first;
    return 1;
  }

  // Multi-byte forms must be canonical (the shortest encoding for the value)
  if (first == 0xfd) {
    if (available < 3)
      return 0;
    value = endian::ReadLE16(buffer + 1);
    return value < 0xfd ? 0 : 3;
  }
  if (first == 0xfe) {
    if (available < 5)
      return 0;
    value = endian::ReadLE32(buffer + 1);
    return value <= 0xffff ? 0 : 5;
  }
  if (available < 9)
    return 0;
  value = endian::ReadLE64(buffer + 1);
  return value <= 0xffffffff ? 0 : 9;
}

// MessageSerializer implementation
MessageSerializer::MessageSerializer() { buffer_.reserve(64); }

void MessageSerializer::write_uint8(uint8_t value) { buffer_.push_back(value); }

void MessageSerializer::write_uint64(uint64_t value) {
  size_t pos = buffer_.size();
  buffer_.resize(pos + 8);
  endian::WriteLE64(buffer_.data() + pos, value);
}

void MessageSerializer::write_bool(bool value) { write_uint8(value ? 1 : 0); }

void MessageSerializer::write_varint(uint64_t value) {
  VarInt vi(value);
  size_t pos = buffer_.size();
  buffer_.resize(pos + vi.encoded_size());
  vi.encode(buffer_.data() + pos);
}

void MessageSerializer::write_bytes(const uint8_t *data, size_t len) {
  buffer_.insert(buffer_.end(), data, data + len);
}

// MessageDeserializer implementation
MessageDeserializer::MessageDeserializer(const uint8_t *data, size_t size)
    : data_(data), size_(size), position_(0), error_(false) {}

MessageDeserializer::MessageDeserializer(const std::vector<uint8_t> &data)
    : data_(data.data()), size_(data.size()), position_(0), error_(false) {}

bool MessageDeserializer::check_available(size_t bytes) {
  if (error_ || bytes_remaining() < bytes) {
    error_ = true;
    return false;
  }
  return true;
}

uint8_t MessageDeserializer::read_uint8() {
  if (!check_available(1))
    return 0;
  return data_[position_++];
}

uint64_t MessageDeserializer::read_uint64() {
  if (!check_available(8))
    return 0;
  uint64_t value = endian::ReadLE64(data_ + position_);
  position_ += 8;
  return value;
}

bool MessageDeserializer::read_bool() {
  uint8_t raw = read_uint8();
  if (raw > 1) {
    error_ = true;
    return false;
  }
  return raw == 1;
}

uint64_t MessageDeserializer::read_varint() {
  if (error_)
    return 0;
  VarInt vi;
  size_t consumed = vi.decode(data_ + position_, bytes_remaining());
  if (consumed == 0) {
    error_ = true;
    return 0;
  }
  position_ += consumed;
  return vi.value;
}

void MessageDeserializer::read_bytes(uint8_t *out, size_t count) {
  if (!check_available(count)) {
    std::memset(out, 0, count);
    return;
  }
  std::memcpy(out, data_ + position_, count);
  position_ += count;
}

// BlockId
BlockId BlockId::FromNumber(BlockNum n) {
  BlockId id;
  id.tag = protocol::BlockIdTag::NUMBER;
  id.number = n;
  return id;
}

BlockId BlockId::FromHash(const BlockHash &h) {
  BlockId id;
  id.tag = protocol::BlockIdTag::HASH;
  id.hash = h;
  return id;
}

bool BlockId::operator==(const BlockId &other) const {
  if (tag != other.tag)
    return false;
  return is_number() ? number == other.number : hash == other.hash;
}

// GetBlockHeadersMessage
GetBlockHeadersMessage::GetBlockHeadersMessage(uint64_t id, BlockId start,
                                               uint64_t lim, uint64_t skp,
                                               bool rev)
    : request_id(id), start_block(start), limit(lim), skip(skp), reverse(rev) {}

std::vector<uint8_t> GetBlockHeadersMessage::serialize() const {
  MessageSerializer s;
  s.write_uint64(request_id);
  s.write_uint8(static_cast<uint8_t>(start_block.tag));
  if (start_block.is_number()) {
    s.write_uint64(start_block.number);
  } else {
    s.write_bytes(start_block.hash.data(), start_block.hash.size());
  }
  s.write_varint(limit);
  s.write_varint(skip);
  s.write_bool(reverse);
  return s.data();
}

bool GetBlockHeadersMessage::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  request_id = d.read_uint64();

  uint8_t tag = d.read_uint8();
  if (tag == static_cast<uint8_t>(protocol::BlockIdTag::NUMBER)) {
    start_block = BlockId::FromNumber(d.read_uint64());
  } else if (tag == static_cast<uint8_t>(protocol::BlockIdTag::HASH)) {
    BlockHash hash;
    d.read_bytes(hash.data(), hash.size());
    start_block = BlockId::FromHash(hash);
  } else {
    return false;
  }

  limit = d.read_varint();
  skip = d.read_varint();
  reverse = d.read_bool();

  if (d.has_error() || d.bytes_remaining() != 0)
    return false;

  // A peer never serves more than this per response; larger asks are bogus
  return limit <= protocol::MAX_HEADERS_PER_REQUEST;
}

} // namespace message
} // namespace headerpipe
