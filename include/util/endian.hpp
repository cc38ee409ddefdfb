// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
#pragma once

// Network byte order (big-endian) helpers for the message codec

#include <bit>
#include <cstdint>
#include <cstring>

namespace meshwalk {
namespace endian {

inline uint16_t byteswap16(uint16_t x) { return static_cast<uint16_t>((x >> 8) | (x << 8)); }

inline uint32_t byteswap32(uint32_t x) {
  return ((x >> 24) & 0x000000FF) | ((x >> 8) & 0x0000FF00) |
         ((x << 8) & 0x00FF0000) | ((x << 24) & 0xFF000000);
}

inline uint64_t byteswap64(uint64_t x) {
  return (static_cast<uint64_t>(byteswap32(static_cast<uint32_t>(x))) << 32) |
         byteswap32(static_cast<uint32_t>(x >> 32));
}

template <typename T> inline T ToBig(T value) {
  if constexpr (std::endian::native == std::endian::big || sizeof(T) == 1) {
    return value;
  } else if constexpr (sizeof(T) == 2) {
    return byteswap16(value);
  } else if constexpr (sizeof(T) == 4) {
    return byteswap32(value);
  } else {
    return byteswap64(value);
  }
}

inline uint16_t ReadBE16(const uint8_t *ptr) {
  uint16_t result;
  std::memcpy(&result, ptr, sizeof(result));
  return ToBig(result);
}

inline uint32_t ReadBE32(const uint8_t *ptr) {
  uint32_t result;
  std::memcpy(&result, ptr, sizeof(result));
  return ToBig(result);
}

inline uint64_t ReadBE64(const uint8_t *ptr) {
  uint64_t result;
  std::memcpy(&result, ptr, sizeof(result));
  return ToBig(result);
}

inline void WriteBE16(uint8_t *ptr, uint16_t value) {
  value = ToBig(value);
  std::memcpy(ptr, &value, sizeof(value));
}

inline void WriteBE32(uint8_t *ptr, uint32_t value) {
  value = ToBig(value);
  std::memcpy(ptr, &value, sizeof(value));
}

inline void WriteBE64(uint8_t *ptr, uint64_t value) {
  value = ToBig(value);
  std::memcpy(ptr, &value, sizeof(value));
}

} // namespace endian
} // namespace meshwalk
