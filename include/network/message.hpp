// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/address.hpp"
#include "network/connection_types.hpp"
#include "network/protocol.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace meshwalk {
namespace message {

/**
 * Serialization buffer for building wire-format payloads
 *
 * Integers are big-endian fixed width; strings and blobs carry a uint16
 * length prefix.
 */
class MessageSerializer {
public:
  MessageSerializer();

  // Write primitives
  void write_uint8(uint8_t value);
  void write_uint16(uint16_t value);
  void write_uint32(uint32_t value);
  void write_uint64(uint64_t value);
  void write_bool(bool value);

  // Write variable-length
  void write_string(const std::string &str);
  void write_blob(const std::vector<uint8_t> &data);
  void write_bytes(const uint8_t *data, size_t len);
  void write_bytes(const std::vector<uint8_t> &data);

  // Write protocol structures
  void write_address(const network::Address &addr);
  void write_connection_type(network::ConnectionType type);

  // Get serialized data
  const std::vector<uint8_t> &data() const { return buffer_; }
  size_t size() const { return buffer_.size(); }

  // Clear buffer
  void clear() { buffer_.clear(); }

private:
  std::vector<uint8_t> buffer_;
};

/**
 * Deserialization buffer for parsing wire-format payloads
 *
 * Reads past the end (or over a limit) set a sticky error flag and return
 * zero values; callers check has_error() once at the end.
 */
class MessageDeserializer {
public:
  MessageDeserializer(const uint8_t *data, size_t size);
  explicit MessageDeserializer(const std::vector<uint8_t> &data);

  // Read primitives
  uint8_t read_uint8();
  uint16_t read_uint16();
  uint32_t read_uint32();
  uint64_t read_uint64();
  bool read_bool();

  // Read variable-length
  std::string read_string(size_t max_length = UINT16_MAX);
  std::vector<uint8_t> read_blob(size_t max_length = UINT16_MAX);
  std::vector<uint8_t> read_bytes(size_t count);

  // Read protocol structures
  network::Address read_address();
  network::ConnectionType read_connection_type();

  // State
  size_t bytes_remaining() const { return size_ - position_; }
  size_t position() const { return position_; }
  bool has_error() const { return error_; }

private:
  const uint8_t *data_;
  size_t size_;
  size_t position_;
  bool error_;

  void check_available(size_t bytes);
};

/**
 * Base class for all message payloads
 */
class Message {
public:
  virtual ~Message() = default;

  // First payload byte (protocol::message_type)
  virtual uint8_t type() const = 0;

  // Serialize message payload
  virtual std::vector<uint8_t> serialize() const = 0;

  // Deserialize message payload (returns true on success)
  virtual bool deserialize(const uint8_t *data, size_t size) = 0;
};

/**
 * INTRODUCTION-REQUEST - sent to a walk target, asks for one introduction
 */
class IntroductionRequest : public Message {
public:
  std::string community_id;
  network::Address destination; // Where the sender believes it is sending
  network::Address source_lan;  // Sender's self-reported LAN address
  network::Address source_wan;  // Sender's self-reported WAN address
  network::ConnectionType connection_type{network::ConnectionType::UNKNOWN};
  bool advice{true};            // Sender wants an introduction back
  uint16_t identifier{0};       // Echoed in the response

  uint8_t type() const override { return protocol::message_type::INTRODUCTION_REQUEST; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

/**
 * INTRODUCTION-RESPONSE - answer to a request, optionally naming a peer
 */
class IntroductionResponse : public Message {
public:
  std::string community_id;
  network::Address destination;
  network::Address source_lan;
  network::Address source_wan;
  network::ConnectionType connection_type{network::ConnectionType::UNKNOWN};
  network::Address lan_introduction; // Empty when nobody was introduced
  network::Address wan_introduction;
  uint16_t identifier{0};

  bool has_introduction() const {
    return !lan_introduction.empty() || !wan_introduction.empty();
  }

  uint8_t type() const override { return protocol::message_type::INTRODUCTION_RESPONSE; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

/**
 * Payload plus its fixed-width signature (over SHA-1 of the payload)
 */
struct SignedMessage {
  std::vector<uint8_t> payload;
  std::vector<uint8_t> signature;

  std::vector<uint8_t> serialize() const;
  static std::optional<SignedMessage> Deserialize(const std::vector<uint8_t> &data);
};

// Message type of a payload, std::nullopt if empty
std::optional<uint8_t> PeekMessageType(const std::vector<uint8_t> &payload);

} // namespace message
} // namespace meshwalk
