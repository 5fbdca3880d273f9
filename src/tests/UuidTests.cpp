// SPDX-License-Identifier: Apache-2.0
#include <core/Uuid.hpp>

#include <catch2/catch_test_macros.hpp>

#include <format>
#include <unordered_set>

using namespace pagent;

TEST_CASE("Default constructed Uuid is nil", "[uuid]")
{
    auto const id = Uuid {};
    CHECK(id.isNil());
    CHECK(id.toString() == "00000000-0000-0000-0000-000000000000");
}

TEST_CASE("Generated Uuids are version 4 and distinct", "[uuid]")
{
    auto seen = std::unordered_set<Uuid> {};
    for (auto i = 0; i < 100; ++i)
    {
        auto const id = Uuid::generate();
        CHECK(!id.isNil());
        CHECK((id.bytes()[6] >> 4) == 4);
        CHECK((id.bytes()[8] & 0xC0) == 0x80);
        seen.insert(id);
    }
    CHECK(seen.size() == 100);
}

TEST_CASE("Uuid string form parses back to the same value", "[uuid]")
{
    auto const id = Uuid::generate();
    auto const parsed = Uuid::parse(id.toString());

    REQUIRE(parsed.has_value());
    CHECK(*parsed == id);
    CHECK(std::format("{}", id) == id.toString());
    CHECK(id.shortString() == id.toString().substr(0, 8));
}

TEST_CASE("Uuid::parse accepts upper case digits", "[uuid]")
{
    auto const parsed = Uuid::parse("123E4567-E89B-12D3-A456-426614174000");
    REQUIRE(parsed.has_value());
    CHECK(parsed->toString() == "123e4567-e89b-12d3-a456-426614174000");
}

TEST_CASE("Uuid::parse rejects malformed input", "[uuid]")
{
    for (auto const* text: {
             "",
             "123e4567e89b12d3a456426614174000",
             "123e4567-e89b-12d3-a456-42661417400",
             "123e4567-e89b-12d3-a456_426614174000",
             "123e4567-e89b-12d3-a456-42661417400g",
         })
    {
        auto const parsed = Uuid::parse(text);
        REQUIRE(!parsed);
        CHECK(parsed.error().code == ErrorCode::InvalidArgument);
    }
}
