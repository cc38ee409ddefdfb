// Unit tests for network address parsing utilities
#include <catch2/catch_test_macros.hpp>
#include "network/address.hpp"
#include "util/netaddress.hpp"
#include <unordered_set>

using namespace meshwalk::util;
using meshwalk::network::Address;

TEST_CASE("ValidateAndNormalizeIP", "[util][netaddress]") {
    SECTION("IPv4 passes through") {
        REQUIRE(ValidateAndNormalizeIP("192.168.1.1") == std::string("192.168.1.1"));
    }

    SECTION("IPv4-mapped IPv6 becomes IPv4") {
        REQUIRE(ValidateAndNormalizeIP("::ffff:192.168.1.1") == std::string("192.168.1.1"));
    }

    SECTION("IPv6 is kept") {
        REQUIRE(ValidateAndNormalizeIP("2001:db8::1") == std::string("2001:db8::1"));
    }

    SECTION("Hostnames and garbage are rejected") {
        REQUIRE_FALSE(ValidateAndNormalizeIP("dispersy1.tribler.org").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("256.1.1.1").has_value());
        REQUIRE_FALSE(IsValidIPAddress("1.2.3"));
    }
}

TEST_CASE("FormatHostPort / ParseHostPort", "[util][netaddress]") {
    REQUIRE(FormatHostPort("10.0.0.1", 6421) == "10.0.0.1:6421");
    REQUIRE(FormatHostPort("::1", 6421) == "[::1]:6421");

    std::string host;
    uint16_t port = 0;

    SECTION("IPv4") {
        REQUIRE(ParseHostPort("10.0.0.1:6421", host, port));
        REQUIRE(host == "10.0.0.1");
        REQUIRE(port == 6421);
    }

    SECTION("Bracketed IPv6") {
        REQUIRE(ParseHostPort("[2001:db8::1]:80", host, port));
        REQUIRE(host == "2001:db8::1");
        REQUIRE(port == 80);
    }

    SECTION("Hostname") {
        REQUIRE(ParseHostPort("dispersy1.st.tudelft.nl:6421", host, port));
        REQUIRE(host == "dispersy1.st.tudelft.nl");
    }

    SECTION("Malformed") {
        REQUIRE_FALSE(ParseHostPort("", host, port));
        REQUIRE_FALSE(ParseHostPort("10.0.0.1", host, port));
        REQUIRE_FALSE(ParseHostPort("10.0.0.1:0", host, port));
        REQUIRE_FALSE(ParseHostPort(":6421", host, port));
        REQUIRE_FALSE(ParseHostPort("::1:80", host, port));
        REQUIRE_FALSE(ParseHostPort("[::1]80", host, port));
    }
}

TEST_CASE("Address value type", "[network][address]") {
    Address a("10.0.0.1", 6421);
    Address b("10.0.0.1", 6421);
    Address c("10.0.0.1", 6422);

    REQUIRE(a == b);
    REQUIRE(a != c);
    REQUIRE(a < c);
    REQUIRE(Address().empty());
    REQUIRE_FALSE(a.empty());

    std::unordered_set<Address> set{a, b, c};
    REQUIRE(set.size() == 2);

    REQUIRE(a.ToString() == "10.0.0.1:6421");
    REQUIRE(Address("::1", 1).ToString() == "[::1]:1");

    auto parsed = Address::FromString("[::1]:1");
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == Address("::1", 1));
    REQUIRE_FALSE(Address::FromString("nonsense").has_value());
}
