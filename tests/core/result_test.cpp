#include "gesu/core/result.hpp"

#include <gtest/gtest.h>

#include <string>

using gesu::Err;
using gesu::Error;
using gesu::ErrorKind;
using gesu::Ok;
using gesu::Result;

namespace {

Result<int> parse_count(const std::string& text) {
    if (text.empty()) {
        return Err<int>(ErrorKind::InvalidArgument, "empty");
    }
    return Ok(std::stoi(text));
}

} // namespace

TEST(ResultTest, CarriesValueOrError) {
    auto ok = parse_count("3");
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 3);

    auto err = parse_count("");
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.error().kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(err.value_or(-1), -1);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok = Ok();
    EXPECT_TRUE(ok.is_ok());

    Result<void> err = Err<void>(ErrorKind::SessionNotFound, "gone");
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.error().message, "gone");
}

TEST(ErrorTest, WireNamesMatchTaxonomy) {
    EXPECT_STREQ(gesu::to_string(ErrorKind::Spawn), "SpawnError");
    EXPECT_STREQ(gesu::to_string(ErrorKind::DuplicateSession), "DuplicateSessionError");
    EXPECT_STREQ(gesu::to_string(ErrorKind::SessionNotFound), "SessionNotFoundError");
    EXPECT_STREQ(gesu::to_string(ErrorKind::DeviceUnready), "DeviceUnreadyError");
    EXPECT_STREQ(gesu::to_string(ErrorKind::TransferIO), "TransferIOError");
    EXPECT_STREQ(gesu::to_string(ErrorKind::Cancellation), "CancellationError");
}

TEST(ErrorTest, DescribeAndGuidance) {
    Error error{ErrorKind::DeviceUnready, "Device R58M is not ready"};
    EXPECT_EQ(error.describe(), "DeviceUnreadyError: Device R58M is not ready");
    EXPECT_NE(std::string(gesu::user_guidance(ErrorKind::DeviceUnready)).find("USB debugging"), std::string::npos);
    EXPECT_STRNE(gesu::user_guidance(ErrorKind::Spawn), "");
}
