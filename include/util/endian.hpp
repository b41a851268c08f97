// Copyright (c) 2014-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

namespace headerpipe {
namespace endian {

// Byteswap helpers (C++23 has std::byteswap)
inline uint16_t byteswap16(uint16_t x) {
  return static_cast<uint16_t>((x >> 8) | (x << 8));
}

inline uint32_t byteswap32(uint32_t x) {
  return ((x >> 24) & 0x000000FF) | ((x >> 8) & 0x0000FF00) |
         ((x << 8) & 0x00FF0000) | ((x << 24) & 0xFF000000);
}

inline uint64_t byteswap64(uint64_t x) {
  return (static_cast<uint64_t>(byteswap32(static_cast<uint32_t>(x))) << 32) |
         byteswap32(static_cast<uint32_t>(x >> 32));
}

template <typename T>
inline T ToLittleEndian(T value) {
  if constexpr (std::endian::native == std::endian::big) {
    if constexpr (sizeof(T) == 2) return byteswap16(value);
    if constexpr (sizeof(T) == 4) return byteswap32(value);
    if constexpr (sizeof(T) == 8) return byteswap64(value);
  }
  return value;
}

inline uint16_t ReadLE16(const uint8_t *ptr) {
  uint16_t result;
  std::memcpy(&result, ptr, sizeof(result));
  return ToLittleEndian(result);
}

inline uint32_t ReadLE32(const uint8_t *ptr) {
  uint32_t result;
  std::memcpy(&result, ptr, sizeof(result));
  return ToLittleEndian(result);
}

inline uint64_t ReadLE64(const uint8_t *ptr) {
  uint64_t result;
  std::memcpy(&result, ptr, sizeof(result));
  return ToLittleEndian(result);
}

inline void WriteLE16(uint8_t *ptr, uint16_t value) {
  value = ToLittleEndian(value);
  std::memcpy(ptr, &value, sizeof(value));
}

inline void WriteLE32(uint8_t *ptr, uint32_t value) {
  value = ToLittleEndian(value);
  std::memcpy(ptr, &value, sizeof(value));
}

inline void WriteLE64(uint8_t *ptr, uint64_t value) {
  value = ToLittleEndian(value);
  std::memcpy(ptr, &value, sizeof(value));
}

} // namespace endian
} // namespace headerpipe
