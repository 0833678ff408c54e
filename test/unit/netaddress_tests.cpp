// Unit tests for network address utilities
#include <catch2/catch_test_macros.hpp>
#include "util/netaddress.hpp"

using namespace deadlock::util;

TEST_CASE("ValidateAndNormalizeIP - accepts IP literals", "[util][netaddress]") {
    SECTION("Standard IPv4 addresses") {
        REQUIRE(ValidateAndNormalizeIP("192.168.1.1").has_value());
        REQUIRE(ValidateAndNormalizeIP("10.0.0.1").has_value());
        REQUIRE(ValidateAndNormalizeIP("8.8.8.8").has_value());
        REQUIRE(ValidateAndNormalizeIP("127.0.0.1").has_value());
        REQUIRE(ValidateAndNormalizeIP("255.255.255.255").has_value());
        REQUIRE(ValidateAndNormalizeIP("0.0.0.0").has_value());
    }

    SECTION("IPv6 addresses") {
        REQUIRE(ValidateAndNormalizeIP("2001:0db8:85a3:0000:0000:8a2e:0370:7334").has_value());
        REQUIRE(ValidateAndNormalizeIP("2001:db8:85a3::8a2e:370:7334").has_value());
        REQUIRE(ValidateAndNormalizeIP("::1").has_value());
        REQUIRE(ValidateAndNormalizeIP("::").has_value());
        REQUIRE(ValidateAndNormalizeIP("fe80::1").has_value());
    }

    SECTION("IPv4-mapped IPv6") {
        REQUIRE(ValidateAndNormalizeIP("::ffff:192.168.1.1").has_value());
        REQUIRE(ValidateAndNormalizeIP("::ffff:c0a8:0101").has_value());
    }
}

TEST_CASE("ValidateAndNormalizeIP - rejects non-literals", "[util][netaddress]") {
    SECTION("Empty string") {
        REQUIRE_FALSE(ValidateAndNormalizeIP("").has_value());
    }

    SECTION("Invalid IPv4") {
        REQUIRE_FALSE(ValidateAndNormalizeIP("256.1.1.1").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("1.1.1").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("1.1.1.1.1").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("abc.def.ghi.jkl").has_value());
    }

    SECTION("Invalid IPv6") {
        REQUIRE_FALSE(ValidateAndNormalizeIP("gggg::1").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("2001:db8:::1").has_value());
    }

    SECTION("Hostnames and endpoints") {
        REQUIRE_FALSE(ValidateAndNormalizeIP("localhost").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("example.com").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("192.168.1.1:8080").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("[::1]:8080").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("unknown").has_value());
    }
}

TEST_CASE("ValidateAndNormalizeIP - canonical forms", "[util][netaddress]") {
    SECTION("IPv4 unchanged") {
        auto result = ValidateAndNormalizeIP("192.168.1.1");
        REQUIRE(result.has_value());
        REQUIRE(*result == "192.168.1.1");
    }

    SECTION("IPv6 full form compresses") {
        auto result = ValidateAndNormalizeIP("2001:0db8:0000:0000:0000:0000:0000:0001");
        REQUIRE(result.has_value());
        REQUIRE(*result == "2001:db8::1");
    }

    SECTION("IPv4-mapped collapses to IPv4") {
        // Dual-stack accept reports IPv4 peers this way; one ledger key per attacker
        auto mapped = ValidateAndNormalizeIP("::ffff:203.0.113.7");
        REQUIRE(mapped.has_value());
        REQUIRE(*mapped == "203.0.113.7");

        auto hex_mapped = ValidateAndNormalizeIP("::ffff:c0a8:0101");
        REQUIRE(hex_mapped.has_value());
        REQUIRE(*hex_mapped == "192.168.1.1");
    }

    SECTION("Invalid inputs") {
        REQUIRE_FALSE(ValidateAndNormalizeIP("").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("256.1.1.1").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("example.com").has_value());
    }
}

TEST_CASE("FormatEndpoint", "[util][netaddress]") {
    REQUIRE(FormatEndpoint("192.168.1.1", 2222) == "192.168.1.1:2222");
    REQUIRE(FormatEndpoint("2001:db8::1", 22) == "[2001:db8::1]:22");
    REQUIRE(FormatEndpoint("::1", 0) == "[::1]:0");
    REQUIRE(FormatEndpoint("unknown", 0) == "unknown:0");
}
