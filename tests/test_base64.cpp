#include <catch2/catch_all.hpp>
#include "utils/Base64.hpp"

using namespace GateResolve;

TEST_CASE("Base64 decodes standard and URL-safe alphabets") {
    auto plain = Base64::Decode("aHR0cDovL3JlYWwuZXhhbXBsZS9hYmM=");
    REQUIRE(plain.has_value());
    CHECK(*plain == "http://real.example/abc");

    auto unpadded = Base64::Decode("aHR0cDovL3JlYWwuZXhhbXBsZS9hYmM");
    REQUIRE(unpadded.has_value());
    CHECK(*unpadded == "http://real.example/abc");

    // 0xfb 0xff encodes to "+/8" in the standard alphabet and "-_8" in the URL-safe one.
    auto standard = Base64::Decode("+/8=");
    auto url_safe = Base64::Decode("-_8");
    REQUIRE(standard.has_value());
    REQUIRE(url_safe.has_value());
    CHECK(*standard == *url_safe);
    CHECK(standard->size() == 2);
}

TEST_CASE("Base64 rejects malformed input") {
    CHECK_FALSE(Base64::Decode("").has_value());
    CHECK_FALSE(Base64::Decode("====").has_value());
    CHECK_FALSE(Base64::Decode("abcde").has_value());
    CHECK_FALSE(Base64::Decode("ab cd").has_value());
    CHECK_FALSE(Base64::Decode("ab*d").has_value());
}

TEST_CASE("LooksEncoded requires length and a clean alphabet") {
    CHECK(Base64::LooksEncoded("aHR0cDovL3JlYWwuZXhhbXBsZS9hYmM="));
    CHECK_FALSE(Base64::LooksEncoded("abc"));
    CHECK(Base64::LooksEncoded("abc", 3));
    CHECK_FALSE(Base64::LooksEncoded("hello world!"));
    CHECK_FALSE(Base64::LooksEncoded("abcd=efgh"));
    CHECK_FALSE(Base64::LooksEncoded("abcdefgh==="));
}
