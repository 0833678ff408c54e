// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "tarpit/event_sink.hpp"
#include "tarpit/session_event.hpp"
#include "util/time.hpp"

using namespace deadlock::tarpit;
using namespace deadlock::util;

TEST_CASE("SessionOutcomeToString", "[tarpit][event]") {
    REQUIRE(std::string(SessionOutcomeToString(SessionOutcome::COMPLETED)) == "completed");
    REQUIRE(std::string(SessionOutcomeToString(SessionOutcome::RESET)) == "reset");
    REQUIRE(std::string(SessionOutcomeToString(SessionOutcome::TIMEOUT)) == "timeout");
    REQUIRE(std::string(SessionOutcomeToString(SessionOutcome::REJECTED)) == "rejected");
    REQUIRE(std::string(SessionOutcomeToString(SessionOutcome::SHUTDOWN)) == "shutdown");
    REQUIRE(std::string(SessionOutcomeToString(SessionOutcome::FORCED)) == "forced");
    REQUIRE(std::string(SessionOutcomeToString(SessionOutcome::ERROR)) == "error");
}

TEST_CASE("SessionEvent JSON record", "[tarpit][event]") {
    SessionEvent event;
    event.session_id = 17;
    event.address = "198.51.100.23";
    event.port = 51422;
    event.connection_count = 4;
    event.delay = std::chrono::milliseconds(7000);
    event.bytes_sent = 41;
    event.bytes_received = 9;
    event.input = "root\\r\\n";
    event.input_truncated = false;
    event.start_time_ms = 1729867990000;
    event.end_time_ms = 1729868000123;
    event.duration = std::chrono::milliseconds(10123);
    event.outcome = SessionOutcome::COMPLETED;

    auto j = ToJson(event);

    REQUIRE(j["timestamp"] == "2024-10-25T14:53:20.123Z");
    REQUIRE(j["session_id"] == 17);
    REQUIRE(j["address"] == "198.51.100.23");
    REQUIRE(j["port"] == 51422);
    REQUIRE(j["connection_count"] == 4);
    REQUIRE(j["delay_ms"] == 7000);
    REQUIRE(j["bytes_sent"] == 41);
    REQUIRE(j["bytes_received"] == 9);
    REQUIRE(j["input"] == "root\\r\\n");
    REQUIRE(j["input_truncated"] == false);
    REQUIRE(j["outcome"] == "completed");
    REQUIRE(j["duration_ms"] == 10123);
    REQUIRE(j.size() == 12);

    SECTION("Serializes to a single line") {
        std::string line = j.dump();
        REQUIRE(line.find('\n') == std::string::npos);
    }
}

TEST_CASE("LogEventSink accepts any event", "[tarpit][event]") {
    LogEventSink sink;
    SessionEvent event;
    event.address = "unknown";
    event.outcome = SessionOutcome::ERROR;
    // Routed to the "event" logger; must not throw even with logging off
    REQUIRE_NOTHROW(sink.Emit(event));
}

TEST_CASE("Time formatting", "[util][time]") {
    SECTION("FormatTime") {
        REQUIRE(FormatTime(1729868000) == "2024-10-25 14:53:20 UTC");
        REQUIRE(FormatTime(0) == "1970-01-01 00:00:00 UTC");
    }

    SECTION("FormatTimeMillis pads milliseconds") {
        REQUIRE(FormatTimeMillis(1729868000000) == "2024-10-25T14:53:20.000Z");
        REQUIRE(FormatTimeMillis(1729868000007) == "2024-10-25T14:53:20.007Z");
    }

    SECTION("FormatTimeMillis before the epoch") {
        REQUIRE(FormatTimeMillis(-1) == "1969-12-31T23:59:59.999Z");
    }
}

TEST_CASE("Mock time", "[util][time]") {
    REQUIRE(GetMockTime() == 0);
    {
        MockTimeScope scope(1700000000);
        REQUIRE(GetTime() == 1700000000);
        REQUIRE(GetTimeMillis() == 1700000000000);
        {
            MockTimeScope nested(1700000100);
            REQUIRE(GetTime() == 1700000100);
        }
        REQUIRE(GetTime() == 1700000000);
    }
    REQUIRE(GetMockTime() == 0);
    REQUIRE(GetTime() > 1700000000);
}
