// SPDX-License-Identifier: Apache-2.0
#include <core/JsonUtils.hpp>

#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <string>

using namespace toolmesh;

TEST_CASE("getIntOr reads integers within range", "[json]")
{
    auto const obj = nlohmann::json { { "small", 42 }, { "negative", -7 }, { "text", "12" } };

    CHECK(json::getIntOr(obj, "small", 1) == 42);
    CHECK(json::getIntOr(obj, "negative", 1) == -7);
    CHECK(json::getIntOr(obj, "text", 1) == 1);
    CHECK(json::getIntOr(obj, "missing", 1) == 1);
    CHECK(json::getIntOr(nlohmann::json::array(), "small", 1) == 1);
}

TEST_CASE("getIntOr falls back on values outside the range of int", "[json]")
{
    auto const obj = nlohmann::json::parse(R"({
        "tooLarge": 4294967396,
        "tooSmall": -4294967396,
        "huge": 18446744073709551615,
        "max": 2147483647,
        "min": -2147483648
    })");

    CHECK(json::getIntOr(obj, "tooLarge", 5000) == 5000);
    CHECK(json::getIntOr(obj, "tooSmall", 5000) == 5000);
    CHECK(json::getIntOr(obj, "huge", 5000) == 5000);
    CHECK(json::getIntOr(obj, "max", 0) == std::numeric_limits<int>::max());
    CHECK(json::getIntOr(obj, "min", 0) == std::numeric_limits<int>::min());
}

TEST_CASE("dump reports strings that are not UTF-8", "[json]")
{
    auto const good = json::dump(nlohmann::json { { "a", "b" } });
    REQUIRE(good.has_value());
    CHECK(*good == R"({"a":"b"})");

    auto const bad = json::dump(nlohmann::json { { "a", std::string("\xff") } });
    REQUIRE(!bad.has_value());
    CHECK(bad.error().code == ErrorCode::InvalidArgument);
    CHECK(bad.error().message.find("UTF-8") != std::string::npos);
}

TEST_CASE("dumpForDisplay replaces invalid UTF-8", "[json]")
{
    auto const printed = json::dumpForDisplay(nlohmann::json(std::string("ok\xff")), -1);
    CHECK(printed == "\"ok\xEF\xBF\xBD\"");
}
