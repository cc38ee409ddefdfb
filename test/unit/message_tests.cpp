// Unit tests for wire-format payloads
#include <catch2/catch_test_macros.hpp>
#include "network/message.hpp"
#include "network/protocol.hpp"

using namespace meshwalk;
using namespace meshwalk::message;
using meshwalk::network::Address;
using meshwalk::network::ConnectionType;

namespace {

IntroductionRequest SampleRequest() {
    IntroductionRequest request;
    request.community_id = "community";
    request.destination = Address("10.0.0.2", 6421);
    request.source_lan = Address("192.168.1.5", 7000);
    request.source_wan = Address("1.2.3.4", 7000);
    request.connection_type = ConnectionType::PUBLIC;
    request.advice = true;
    request.identifier = 0xbeef;
    return request;
}

} // anonymous namespace

TEST_CASE("MessageSerializer - primitives are big-endian", "[network][message]") {
    MessageSerializer s;
    s.write_uint16(0x0102);
    s.write_uint32(0x03040506);
    s.write_string("ab");
    REQUIRE(s.data() == std::vector<uint8_t>{0x01, 0x02, 0x03, 0x04, 0x05, 0x06,
                                             0x00, 0x02, 'a', 'b'});

    MessageDeserializer d(s.data());
    REQUIRE(d.read_uint16() == 0x0102);
    REQUIRE(d.read_uint32() == 0x03040506);
    REQUIRE(d.read_string() == "ab");
    REQUIRE_FALSE(d.has_error());
    REQUIRE(d.bytes_remaining() == 0);
}

TEST_CASE("MessageDeserializer - errors are sticky", "[network][message]") {
    SECTION("Reading past the end") {
        std::vector<uint8_t> data{0x01};
        MessageDeserializer d(data);
        REQUIRE(d.read_uint32() == 0);
        REQUIRE(d.has_error());
        REQUIRE(d.read_uint8() == 0);
        REQUIRE(d.has_error());
    }

    SECTION("String longer than its limit") {
        MessageSerializer s;
        s.write_string("too long");
        MessageDeserializer d(s.data());
        REQUIRE(d.read_string(4).empty());
        REQUIRE(d.has_error());
    }

    SECTION("Booleans are 0 or 1") {
        std::vector<uint8_t> data{0x02};
        MessageDeserializer d(data);
        d.read_bool();
        REQUIRE(d.has_error());
    }

    SECTION("Connection type out of range") {
        std::vector<uint8_t> data{0x03};
        MessageDeserializer d(data);
        REQUIRE(d.read_connection_type() == ConnectionType::UNKNOWN);
        REQUIRE(d.has_error());
    }
}

TEST_CASE("IntroductionRequest - encoding", "[network][message]") {
    IntroductionRequest request = SampleRequest();
    auto payload = request.serialize();

    REQUIRE(PeekMessageType(payload) == protocol::message_type::INTRODUCTION_REQUEST);
    REQUIRE(payload[1] == protocol::PROTOCOL_VERSION);

    IntroductionRequest decoded;
    REQUIRE(decoded.deserialize(payload.data(), payload.size()));
    CHECK(decoded.community_id == "community");
    CHECK(decoded.destination == request.destination);
    CHECK(decoded.source_lan == request.source_lan);
    CHECK(decoded.source_wan == request.source_wan);
    CHECK(decoded.connection_type == ConnectionType::PUBLIC);
    CHECK(decoded.advice);
    CHECK(decoded.identifier == 0xbeef);

    SECTION("Trailing bytes are rejected") {
        payload.push_back(0x00);
        REQUIRE_FALSE(decoded.deserialize(payload.data(), payload.size()));
    }

    SECTION("Truncation is rejected") {
        payload.pop_back();
        REQUIRE_FALSE(decoded.deserialize(payload.data(), payload.size()));
    }

    SECTION("A response does not parse as a request") {
        IntroductionResponse response;
        REQUIRE_FALSE(response.deserialize(payload.data(), payload.size()));
    }

    SECTION("Unknown protocol version is rejected") {
        payload[1] = protocol::PROTOCOL_VERSION + 1;
        REQUIRE_FALSE(decoded.deserialize(payload.data(), payload.size()));
    }
}

TEST_CASE("IntroductionResponse - encoding", "[network][message]") {
    IntroductionResponse response;
    response.community_id = "community";
    response.destination = Address("1.2.3.4", 7000);
    response.source_lan = Address("10.0.0.2", 6421);
    response.source_wan = Address("10.0.0.2", 6421);
    response.identifier = 7;

    SECTION("Without an introduction") {
        REQUIRE_FALSE(response.has_introduction());
        auto payload = response.serialize();
        REQUIRE(PeekMessageType(payload) == protocol::message_type::INTRODUCTION_RESPONSE);

        IntroductionResponse decoded;
        REQUIRE(decoded.deserialize(payload.data(), payload.size()));
        CHECK_FALSE(decoded.has_introduction());
        CHECK(decoded.identifier == 7);
    }

    SECTION("With an introduction") {
        response.lan_introduction = Address("192.168.0.9", 9);
        response.wan_introduction = Address("5.6.7.8", 9);
        auto payload = response.serialize();

        IntroductionResponse decoded;
        REQUIRE(decoded.deserialize(payload.data(), payload.size()));
        REQUIRE(decoded.has_introduction());
        CHECK(decoded.lan_introduction == response.lan_introduction);
        CHECK(decoded.wan_introduction == response.wan_introduction);
    }
}

TEST_CASE("SignedMessage - framing", "[network][message]") {
    SignedMessage msg;
    msg.payload = SampleRequest().serialize();
    msg.signature = std::vector<uint8_t>(42, 0x5a);

    auto wire = msg.serialize();
    REQUIRE(wire.size() == 4 + msg.payload.size() + 2 + 42);

    auto decoded = SignedMessage::Deserialize(wire);
    REQUIRE(decoded.has_value());
    CHECK(decoded->payload == msg.payload);
    CHECK(decoded->signature == msg.signature);

    SECTION("Truncated frames are rejected") {
        wire.pop_back();
        REQUIRE_FALSE(SignedMessage::Deserialize(wire).has_value());
    }

    SECTION("Oversized payload length is rejected") {
        std::vector<uint8_t> bogus{0xff, 0xff, 0xff, 0xff};
        REQUIRE_FALSE(SignedMessage::Deserialize(bogus).has_value());
    }

    SECTION("Empty payload has no message type") {
        REQUIRE_FALSE(PeekMessageType({}).has_value());
    }
}
