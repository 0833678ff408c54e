// Unit tests for string parsing utilities
#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"
#include <limits>

using namespace deadlock::util;
using namespace std::chrono_literals;

TEST_CASE("SafeParseInt64 - valid inputs", "[util][string_parsing]") {
    SECTION("Parse valid positive integer") {
        auto result = SafeParseInt64("42", 0, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("Parse valid negative integer") {
        auto result = SafeParseInt64("-50", -100, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == -50);
    }

    SECTION("Parse at bounds") {
        REQUIRE(SafeParseInt64("0", 0, 100) == 0);
        REQUIRE(SafeParseInt64("100", 0, 100) == 100);
    }
}

TEST_CASE("SafeParseInt64 - invalid inputs", "[util][string_parsing]") {
    SECTION("Empty string") {
        REQUIRE_FALSE(SafeParseInt64("", 0, 100).has_value());
    }

    SECTION("Out of range") {
        REQUIRE_FALSE(SafeParseInt64("101", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt64("-1", 0, 100).has_value());
    }

    SECTION("Trailing garbage") {
        REQUIRE_FALSE(SafeParseInt64("42x", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt64("42 ", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt64("4.2", 0, 100).has_value());
    }

    SECTION("Leading whitespace") {
        REQUIRE_FALSE(SafeParseInt64(" 42", 0, 100).has_value());
    }

    SECTION("Not a number") {
        REQUIRE_FALSE(SafeParseInt64("abc", 0, 100).has_value());
    }
}

TEST_CASE("SafeParsePort - valid inputs", "[util][string_parsing]") {
    REQUIRE(SafeParsePort("1") == 1);
    REQUIRE(SafeParsePort("22") == 22);
    REQUIRE(SafeParsePort("2222") == 2222);
    REQUIRE(SafeParsePort("65535") == 65535);
}

TEST_CASE("SafeParsePort - invalid inputs", "[util][string_parsing]") {
    SECTION("Port zero") {
        REQUIRE_FALSE(SafeParsePort("0").has_value());
    }

    SECTION("Above 65535") {
        REQUIRE_FALSE(SafeParsePort("65536").has_value());
        REQUIRE_FALSE(SafeParsePort("99999999999999999999").has_value());
    }

    SECTION("Negative and garbage") {
        REQUIRE_FALSE(SafeParsePort("-22").has_value());
        REQUIRE_FALSE(SafeParsePort("ssh").has_value());
        REQUIRE_FALSE(SafeParsePort("").has_value());
    }
}

TEST_CASE("SafeParseInt64 - limits", "[util][string_parsing]") {
    const auto max = std::numeric_limits<int64_t>::max();
    const auto min = std::numeric_limits<int64_t>::min();

    REQUIRE(SafeParseInt64("9223372036854775807", min, max) == max);
    REQUIRE(SafeParseInt64("-9223372036854775808", min, max) == min);
    REQUIRE_FALSE(SafeParseInt64("9223372036854775808", min, max).has_value());
}

TEST_CASE("SafeParseSeconds - fractional durations", "[util][string_parsing]") {
    SECTION("Whole and fractional seconds") {
        REQUIRE(SafeParseSeconds("60") == std::chrono::milliseconds(60000));
        REQUIRE(SafeParseSeconds("0.1") == std::chrono::milliseconds(100));
        REQUIRE(SafeParseSeconds("1.5") == std::chrono::milliseconds(1500));
        REQUIRE(SafeParseSeconds("0") == std::chrono::milliseconds(0));
    }

    SECTION("Rounds to the nearest millisecond") {
        REQUIRE(SafeParseSeconds("0.0004") == std::chrono::milliseconds(0));
        REQUIRE(SafeParseSeconds("0.0006") == std::chrono::milliseconds(1));
    }

    SECTION("Rejects negative, non-finite and garbage") {
        REQUIRE_FALSE(SafeParseSeconds("-1").has_value());
        REQUIRE_FALSE(SafeParseSeconds("-0.5").has_value());
        REQUIRE_FALSE(SafeParseSeconds("nan").has_value());
        REQUIRE_FALSE(SafeParseSeconds("inf").has_value());
        REQUIRE_FALSE(SafeParseSeconds("1s").has_value());
        REQUIRE_FALSE(SafeParseSeconds("").has_value());
        REQUIRE_FALSE(SafeParseSeconds(" 1").has_value());
    }

    SECTION("Respects the upper bound") {
        REQUIRE(SafeParseSeconds("10", 10.0) == std::chrono::milliseconds(10000));
        REQUIRE_FALSE(SafeParseSeconds("10.5", 10.0).has_value());
        REQUIRE_FALSE(SafeParseSeconds("1e300").has_value());
    }
}

TEST_CASE("SafeParseBool - INI booleans", "[util][string_parsing]") {
    SECTION("True spellings") {
        for (const char* s : {"1", "true", "TRUE", "True", "yes", "Yes", "on", "ON"}) {
            INFO(s);
            REQUIRE(SafeParseBool(s) == true);
        }
    }

    SECTION("False spellings") {
        for (const char* s : {"0", "false", "False", "no", "NO", "off", "Off"}) {
            INFO(s);
            REQUIRE(SafeParseBool(s) == false);
        }
    }

    SECTION("Rejected") {
        REQUIRE_FALSE(SafeParseBool("").has_value());
        REQUIRE_FALSE(SafeParseBool("2").has_value());
        REQUIRE_FALSE(SafeParseBool("maybe").has_value());
        REQUIRE_FALSE(SafeParseBool(" true").has_value());
    }
}

TEST_CASE("EscapeBytes - printable rendering", "[util][string_parsing]") {
    auto bytes = [](const std::string& s) {
        return std::vector<uint8_t>(s.begin(), s.end());
    };

    SECTION("Printable ASCII unchanged") {
        REQUIRE(EscapeBytes(bytes("SSH-2.0-libssh_0.9.6")) == "SSH-2.0-libssh_0.9.6");
        REQUIRE(EscapeBytes(bytes("root admin")) == "root admin");
    }

    SECTION("Line breaks and tabs escaped") {
        REQUIRE(EscapeBytes(bytes("root\r\n")) == "root\\r\\n");
        REQUIRE(EscapeBytes(bytes("a\tb")) == "a\\tb");
    }

    SECTION("Backslash doubled") {
        REQUIRE(EscapeBytes(bytes("C:\\x41")) == "C:\\\\x41");
    }

    SECTION("Binary bytes as hex") {
        std::vector<uint8_t> data = {0x00, 0x14, 0x7f, 0x80, 0xff, 'A'};
        REQUIRE(EscapeBytes(data) == "\\x00\\x14\\x7f\\x80\\xffA");
    }

    SECTION("Output never contains control characters") {
        std::vector<uint8_t> all;
        for (int b = 0; b < 256; ++b) {
            all.push_back(static_cast<uint8_t>(b));
        }
        std::string out = EscapeBytes(all);
        for (char c : out) {
            auto u = static_cast<unsigned char>(c);
            REQUIRE(u >= 0x20);
            REQUIRE(u < 0x7f);
        }
    }

    SECTION("Empty input") {
        REQUIRE(EscapeBytes({}).empty());
    }
}
