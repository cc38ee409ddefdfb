// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>

namespace meshwalk {
namespace protocol {

// Wire version of the introduction messages
constexpr uint8_t PROTOCOL_VERSION = 1;

// Message type bytes (first byte of every payload)
namespace message_type {
constexpr uint8_t INTRODUCTION_RESPONSE = 0xf5;
constexpr uint8_t INTRODUCTION_REQUEST = 0xf6;
} // namespace message_type

// Candidate lifetimes (seconds). A candidate stays in a category for this
// long after the event that put it there.
constexpr double CANDIDATE_WALK_LIFETIME = 57.5;
constexpr double CANDIDATE_STUMBLE_LIFETIME = 57.5;
constexpr double CANDIDATE_INTRO_LIFETIME = 27.5;

// Minimum time between two walks to the same candidate
constexpr double CANDIDATE_ELIGIBLE_DELAY = 27.5;
constexpr double CANDIDATE_ELIGIBLE_BOOTSTRAP_DELAY = 55.0;

// Walk category weights, in units of 1/100000
namespace walk_weight {
constexpr uint32_t WALK = 49750;
constexpr uint32_t STUMBLE = 24875;
constexpr uint32_t INTRO = 24875;
constexpr uint32_t BOOTSTRAP = 500;
constexpr uint32_t TOTAL = WALK + STUMBLE + INTRO + BOOTSTRAP;
} // namespace walk_weight

// Walker defaults (seconds)
constexpr double DEFAULT_WALK_INTERVAL = 5.0;
constexpr double DEFAULT_WALK_TIMEOUT = 10.5;

// Bootstrap resolver defaults (seconds)
constexpr double DEFAULT_RESOLVE_INTERVAL = 300.0;
constexpr double DEFAULT_LOOKUP_TIMEOUT = 10.0;

// Wire limits
constexpr size_t MAX_HOST_LENGTH = 255;
constexpr size_t MAX_COMMUNITY_ID_LENGTH = 255;
constexpr size_t MAX_SIGNATURE_SIZE = 1024;
constexpr size_t MAX_PAYLOAD_SIZE = 64 * 1024;

} // namespace protocol
} // namespace meshwalk
