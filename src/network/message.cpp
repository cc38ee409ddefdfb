// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/message.hpp"
#include "util/endian.hpp"
#include <algorithm>
#include <cstring>

namespace meshwalk {
namespace message {

// MessageSerializer implementation
MessageSerializer::MessageSerializer() {
  buffer_.reserve(256);
}

void MessageSerializer::write_uint8(uint8_t value) { buffer_.push_back(value); }

void MessageSerializer::write_uint16(uint16_t value) {
  size_t pos = buffer_.size();
  buffer_.resize(pos + 2);
  endian::WriteBE16(buffer_.data() + pos, value);
}

void MessageSerializer::write_uint32(uint32_t value) {
  size_t pos = buffer_.size();
  buffer_.resize(pos + 4);
  endian::WriteBE32(buffer_.data() + pos, value);
}

void MessageSerializer::write_uint64(uint64_t value) {
  size_t pos = buffer_.size();
  buffer_.resize(pos + 8);
  endian::WriteBE64(buffer_.data() + pos, value);
}

void MessageSerializer::write_bool(bool value) { write_uint8(value ? 1 : 0); }

void MessageSerializer::write_string(const std::string &str) {
  // Longer strings are a caller bug; truncate rather than emit a bad prefix
  size_t len = std::min<size_t>(str.length(), UINT16_MAX);
  write_uint16(static_cast<uint16_t>(len));
  write_bytes(reinterpret_cast<const uint8_t *>(str.data()), len);
}

void MessageSerializer::write_blob(const std::vector<uint8_t> &data) {
  size_t len = std::min<size_t>(data.size(), UINT16_MAX);
  write_uint16(static_cast<uint16_t>(len));
  write_bytes(data.data(), len);
}

void MessageSerializer::write_bytes(const uint8_t *data, size_t len) {
  buffer_.insert(buffer_.end(), data, data + len);
}

void MessageSerializer::write_bytes(const std::vector<uint8_t> &data) {
  buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void MessageSerializer::write_address(const network::Address &addr) {
  write_string(addr.host);
  write_uint16(addr.port);
}

void MessageSerializer::write_connection_type(network::ConnectionType type) {
  write_uint8(static_cast<uint8_t>(type));
}

// MessageDeserializer implementation
MessageDeserializer::MessageDeserializer(const uint8_t *data, size_t size)
    : data_(data), size_(size), position_(0), error_(false) {}

MessageDeserializer::MessageDeserializer(const std::vector<uint8_t> &data)
    : data_(data.data()), size_(data.size()), position_(0), error_(false) {}

void MessageDeserializer::check_available(size_t bytes) {
  if (bytes_remaining() < bytes) {
    error_ = true;
  }
}

uint8_t MessageDeserializer::read_uint8() {
  check_available(1);
  if (error_)
    return 0;
  return data_[position_++];
}

uint16_t MessageDeserializer::read_uint16() {
  check_available(2);
  if (error_)
    return 0;
  uint16_t value = endian::ReadBE16(data_ + position_);
  position_ += 2;
  return value;
}

uint32_t MessageDeserializer::read_uint32() {
  check_available(4);
  if (error_)
    return 0;
  uint32_t value = endian::ReadBE32(data_ + position_);
  position_ += 4;
  return value;
}

uint64_t MessageDeserializer::read_uint64() {
  check_available(8);
  if (error_)
    return 0;
  uint64_t value = endian::ReadBE64(data_ + position_);
  position_ += 8;
  return value;
}

bool MessageDeserializer::read_bool() {
  uint8_t value = read_uint8();
  if (value > 1) {
    error_ = true;
  }
  return value == 1;
}

std::string MessageDeserializer::read_string(size_t max_length) {
  uint16_t len = read_uint16();

  // Enforce maximum length before allocation
  if (error_ || len > max_length || len > bytes_remaining()) {
    error_ = true;
    return "";
  }

  std::string result(reinterpret_cast<const char *>(data_ + position_), len);
  position_ += len;
  return result;
}

std::vector<uint8_t> MessageDeserializer::read_blob(size_t max_length) {
  uint16_t len = read_uint16();
  if (error_ || len > max_length) {
    error_ = true;
    return {};
  }
  return read_bytes(len);
}

std::vector<uint8_t> MessageDeserializer::read_bytes(size_t count) {
  check_available(count);
  if (error_)
    return {};

  std::vector<uint8_t> result(data_ + position_, data_ + position_ + count);
  position_ += count;
  return result;
}

network::Address MessageDeserializer::read_address() {
  network::Address addr;
  addr.host = read_string(protocol::MAX_HOST_LENGTH);
  addr.port = read_uint16();
  return addr;
}

network::ConnectionType MessageDeserializer::read_connection_type() {
  uint8_t raw = read_uint8();
  if (raw > static_cast<uint8_t>(network::ConnectionType::SYMMETRIC_NAT)) {
    error_ = true;
    return network::ConnectionType::UNKNOWN;
  }
  return static_cast<network::ConnectionType>(raw);
}

// Common header: type byte, version byte, community id
static void WriteHeader(MessageSerializer &s, uint8_t type,
                        const std::string &community_id) {
  s.write_uint8(type);
  s.write_uint8(protocol::PROTOCOL_VERSION);
  s.write_string(community_id);
}

static bool ReadHeader(MessageDeserializer &d, uint8_t expected_type,
                       std::string &community_id) {
  uint8_t type = d.read_uint8();
  uint8_t version = d.read_uint8();
  community_id = d.read_string(protocol::MAX_COMMUNITY_ID_LENGTH);
  return !d.has_error() && type == expected_type &&
         version == protocol::PROTOCOL_VERSION;
}

// IntroductionRequest
std::vector<uint8_t> IntroductionRequest::serialize() const {
  MessageSerializer s;
  WriteHeader(s, type(), community_id);
  s.write_address(destination);
  s.write_address(source_lan);
  s.write_address(source_wan);
  s.write_connection_type(connection_type);
  s.write_bool(advice);
  s.write_uint16(identifier);
  return s.data();
}

bool IntroductionRequest::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  if (!ReadHeader(d, type(), community_id))
    return false;
  destination = d.read_address();
  source_lan = d.read_address();
  source_wan = d.read_address();
  connection_type = d.read_connection_type();
  advice = d.read_bool();
  identifier = d.read_uint16();
  return !d.has_error() && d.bytes_remaining() == 0;
}

// IntroductionResponse
std::vector<uint8_t> IntroductionResponse::serialize() const {
  MessageSerializer s;
  WriteHeader(s, type(), community_id);
  s.write_address(destination);
  s.write_address(source_lan);
  s.write_address(source_wan);
  s.write_connection_type(connection_type);
  s.write_address(lan_introduction);
  s.write_address(wan_introduction);
  s.write_uint16(identifier);
  return s.data();
}

bool IntroductionResponse::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  if (!ReadHeader(d, type(), community_id))
    return false;
  destination = d.read_address();
  source_lan = d.read_address();
  source_wan = d.read_address();
  connection_type = d.read_connection_type();
  lan_introduction = d.read_address();
  wan_introduction = d.read_address();
  identifier = d.read_uint16();
  return !d.has_error() && d.bytes_remaining() == 0;
}

// SignedMessage: uint32 payload length, payload, uint16 signature length, signature
std::vector<uint8_t> SignedMessage::serialize() const {
  MessageSerializer s;
  s.write_uint32(static_cast<uint32_t>(payload.size()));
  s.write_bytes(payload);
  s.write_blob(signature);
  return s.data();
}

std::optional<SignedMessage> SignedMessage::Deserialize(const std::vector<uint8_t> &data) {
  MessageDeserializer d(data);
  uint32_t payload_len = d.read_uint32();
  if (d.has_error() || payload_len > protocol::MAX_PAYLOAD_SIZE) {
    return std::nullopt;
  }
  SignedMessage msg;
  msg.payload = d.read_bytes(payload_len);
  msg.signature = d.read_blob(protocol::MAX_SIGNATURE_SIZE);
  if (d.has_error() || d.bytes_remaining() != 0) {
    return std::nullopt;
  }
  return msg;
}

std::optional<uint8_t> PeekMessageType(const std::vector<uint8_t> &payload) {
  if (payload.empty()) {
    return std::nullopt;
  }
  return payload[0];
}

} // namespace message
} // namespace meshwalk
