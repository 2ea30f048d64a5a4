// Unit tests for string parsing utilities
#include <catch2/catch.hpp>
#include "util/string_parsing.hpp"
#include <limits>

using namespace offsync::util;

TEST_CASE("SafeParseInt - valid inputs", "[util][string_parsing]") {
    SECTION("Parse valid positive integer") {
        auto result = SafeParseInt("42", 0, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("Parse valid negative integer") {
        auto result = SafeParseInt("-50", -100, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == -50);
    }

    SECTION("Parse at bounds") {
        REQUIRE(SafeParseInt("0", 0, 100) == 0);
        REQUIRE(SafeParseInt("100", 0, 100) == 100);
    }
}

TEST_CASE("SafeParseInt - invalid inputs", "[util][string_parsing]") {
    SECTION("Empty string") {
        REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
    }

    SECTION("Non-numeric string") {
        REQUIRE_FALSE(SafeParseInt("abc", 0, 100).has_value());
    }

    SECTION("Trailing characters") {
        REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("42 ", 0, 100).has_value());
    }

    SECTION("Leading whitespace or plus") {
        REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("+42", 0, 100).has_value());
    }

    SECTION("Out of range") {
        REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("-1", 0, 100).has_value());
    }

    SECTION("Overflow") {
        REQUIRE_FALSE(SafeParseInt("99999999999999999999", std::numeric_limits<int>::min(),
                                   std::numeric_limits<int>::max()).has_value());
    }
}

TEST_CASE("SafeParseInt64 - millisecond values", "[util][string_parsing]") {
    auto result = SafeParseInt64("1735689600000", 0, std::numeric_limits<int64_t>::max());
    REQUIRE(result.has_value());
    REQUIRE(*result == 1735689600000LL);

    REQUIRE_FALSE(SafeParseInt64("1.5", 0, 100).has_value());
}

TEST_CASE("SafeParsePort - port validation", "[util][string_parsing]") {
    REQUIRE(SafeParsePort("8000") == uint16_t{8000});
    REQUIRE(SafeParsePort("1") == uint16_t{1});
    REQUIRE(SafeParsePort("65535") == uint16_t{65535});
    REQUIRE_FALSE(SafeParsePort("0").has_value());
    REQUIRE_FALSE(SafeParsePort("65536").has_value());
    REQUIRE_FALSE(SafeParsePort("-1").has_value());
    REQUIRE_FALSE(SafeParsePort("http").has_value());
}

TEST_CASE("SafeParseBool - accepted spellings", "[util][string_parsing]") {
    for (const char* s : {"1", "true", "TRUE", "yes", "on"}) {
        REQUIRE(SafeParseBool(s) == true);
    }
    for (const char* s : {"0", "false", "False", "no", "off"}) {
        REQUIRE(SafeParseBool(s) == false);
    }
    REQUIRE_FALSE(SafeParseBool("").has_value());
    REQUIRE_FALSE(SafeParseBool("maybe").has_value());
}

TEST_CASE("SplitList - comma separated values", "[util][string_parsing]") {
    SECTION("Basic") {
        auto parts = SplitList("sync,queue,net");
        REQUIRE(parts == std::vector<std::string>{"sync", "queue", "net"});
    }

    SECTION("Single item") {
        REQUIRE(SplitList("all") == std::vector<std::string>{"all"});
    }

    SECTION("Empty items dropped") {
        REQUIRE(SplitList(",sync,,queue,") == std::vector<std::string>{"sync", "queue"});
        REQUIRE(SplitList("").empty());
    }
}

TEST_CASE("ParseHttpUrl - server endpoints", "[util][string_parsing]") {
    SECTION("Host, port and base path") {
        auto ep = ParseHttpUrl("http://localhost:8000/v1/");
        REQUIRE(ep.has_value());
        CHECK(ep->host == "localhost");
        CHECK(ep->port == 8000);
        CHECK(ep->base_path == "/v1");
    }

    SECTION("Default port, no path") {
        auto ep = ParseHttpUrl("http://sync.example.com");
        REQUIRE(ep.has_value());
        CHECK(ep->host == "sync.example.com");
        CHECK(ep->port == 80);
        CHECK(ep->base_path.empty());
    }

    SECTION("Bare slash path") {
        auto ep = ParseHttpUrl("http://10.0.0.5:9000/");
        REQUIRE(ep.has_value());
        CHECK(ep->host == "10.0.0.5");
        CHECK(ep->port == 9000);
        CHECK(ep->base_path.empty());
    }

    SECTION("Rejected inputs") {
        REQUIRE_FALSE(ParseHttpUrl("https://example.com").has_value());
        REQUIRE_FALSE(ParseHttpUrl("example.com:8000").has_value());
        REQUIRE_FALSE(ParseHttpUrl("http://").has_value());
        REQUIRE_FALSE(ParseHttpUrl("http://:8000").has_value());
        REQUIRE_FALSE(ParseHttpUrl("http://host:notaport").has_value());
        REQUIRE_FALSE(ParseHttpUrl("http://host:70000").has_value());
    }
}
