/// @file tests/core/test_error.cpp
/// @brief Tests for Error, Result and Status.

#include "tacore/error.hpp"

#include <gtest/gtest.h>
#include <fmt/format.h>

#include <memory>
#include <string>

using namespace tacore;

// ─── Error ────────────────────────────────────────────────────────────────────

TEST(ErrorFactories, InvalidParameterNamesBoth) {
    const Error e = Error::invalid_parameter("period", "0");
    EXPECT_EQ(e.kind, ErrorKind::InvalidParameter);
    EXPECT_NE(e.message.find("period"), std::string::npos);
    EXPECT_NE(e.message.find("'0'"), std::string::npos);
}

TEST(ErrorFactories, UnknownParameterIsInvalidParameter) {
    EXPECT_EQ(Error::unknown_parameter("foo").kind, ErrorKind::InvalidParameter);
}

TEST(ErrorFactories, SeedAndDomainKinds) {
    EXPECT_EQ(Error::incompatible_seed("SMA", "nan").kind, ErrorKind::IncompatibleSeed);
    EXPECT_EQ(Error::domain("X", "broken").kind, ErrorKind::Domain);
}

TEST(ErrorFormat, ToStringPrefixesKind) {
    const Error e = Error::domain("X", "broken");
    EXPECT_EQ(e.to_string(), "Domain: X: broken");
    EXPECT_EQ(fmt::format("{}", e), e.to_string());
}

// ─── Result ───────────────────────────────────────────────────────────────────

TEST(ResultValue, HoldsValue) {
    const Result<int> r = 5;
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(*r, 5);
}

TEST(ResultValue, HoldsError) {
    const Result<int> r = Error::unknown_parameter("p");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidParameter);
    EXPECT_EQ(r.value_or(7), 7);
}

TEST(ResultValue, MovesOutMoveOnlyValue) {
    Result<std::unique_ptr<int>> r = std::make_unique<int>(3);
    ASSERT_TRUE(r);
    std::unique_ptr<int> p = std::move(r).value();
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(*p, 3);
}

TEST(ResultValue, AccessingValueOfErrorThrows) {
    Result<int> r = Error::domain("X", "y");
    EXPECT_THROW((void)r.value(), std::bad_variant_access);
}

// ─── Status ───────────────────────────────────────────────────────────────────

TEST(StatusValue, DefaultIsSuccess) {
    const Status s;
    EXPECT_TRUE(s.has_value());
}

TEST(StatusValue, CarriesError) {
    const Status s = Error::invalid_configuration("SMA");
    ASSERT_FALSE(s);
    EXPECT_EQ(s.error().kind, ErrorKind::InvalidParameter);
}
