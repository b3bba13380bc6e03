#include <doctest/doctest.h>
#include <pathsafe/null_value_handler.hpp>

#include <cctype>

using namespace pathsafe;

namespace {

ValidationError null_error() {
    return ValidationError(ErrorReason::NULL_NAME, Platform::Universal);
}

} // namespace

TEST_CASE("return_null_string yields empty") {
    auto v = return_null_string(null_error());
    REQUIRE(v.has_value());
    CHECK(v->empty());
}

TEST_CASE("raise_error propagates") {
    CHECK_FALSE(raise_error(null_error()).has_value());
}

TEST_CASE("return_timestamp is seconds with microseconds") {
    auto v = return_timestamp(null_error());
    REQUIRE(v.has_value());
    auto dot = v->find('.');
    REQUIRE(dot != std::string::npos);
    CHECK(dot >= 10);
    CHECK(v->size() - dot - 1 == 6);
    for (size_t i = 0; i < v->size(); ++i) {
        if (i != dot) {
            CHECK(std::isdigit(static_cast<unsigned char>((*v)[i])));
        }
    }
}

TEST_CASE("strategy tags") {
    CHECK(parse_null_value_strategy("empty") == NullValueStrategy::ReturnEmpty);
    CHECK(parse_null_value_strategy("RAISE") == NullValueStrategy::Raise);
    CHECK(parse_null_value_strategy("timestamp") == NullValueStrategy::Timestamp);
    CHECK_FALSE(parse_null_value_strategy("zero").has_value());
    CHECK(std::string(null_value_strategy_to_string(NullValueStrategy::Raise)) == "raise");
}

TEST_CASE("handler lookup by strategy") {
    auto empty = get_null_value_handler(NullValueStrategy::ReturnEmpty);
    CHECK(empty(null_error()) == std::string());

    auto raise = get_null_value_handler(NullValueStrategy::Raise);
    CHECK_FALSE(raise(null_error()).has_value());

    auto ts = get_null_value_handler(NullValueStrategy::Timestamp);
    CHECK(ts(null_error())->find('.') != std::string::npos);
}
