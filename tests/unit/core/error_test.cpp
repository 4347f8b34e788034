#include <vinfer/core/error.hpp>
#include <gtest/gtest.h>

namespace vc = vinfer::core;

TEST(ErrorCode, KindStringsAreStable) {
  EXPECT_EQ(vc::to_string(vc::ErrorCode::UnsupportedScheme), "unsupported_scheme");
  EXPECT_EQ(vc::to_string(vc::ErrorCode::TransportFailed), "transport");
  EXPECT_EQ(vc::to_string(vc::ErrorCode::DecodeFailed), "decode");
  EXPECT_EQ(vc::to_string(vc::ErrorCode::InferenceFailed), "model");
  EXPECT_EQ(vc::to_string(vc::ErrorCode::InvalidConfig), "config");
}

TEST(ErrorCode, FromStringInvertsToString) {
  for (auto code : {vc::ErrorCode::UnsupportedScheme, vc::ErrorCode::TransportFailed,
                    vc::ErrorCode::DecodeFailed, vc::ErrorCode::InferenceFailed,
                    vc::ErrorCode::DeliveryFailed, vc::ErrorCode::Unauthorized,
                    vc::ErrorCode::NotFound}) {
    EXPECT_EQ(vc::error_code_from_string(vc::to_string(code)), code);
  }
  EXPECT_EQ(vc::error_code_from_string("bogus"), vc::ErrorCode::None);
}

TEST(ErrorCode, OnlySourceAndModelErrorsAreItemScoped) {
  EXPECT_TRUE(vc::is_item_error(vc::ErrorCode::TransportFailed));
  EXPECT_TRUE(vc::is_item_error(vc::ErrorCode::DecodeFailed));
  EXPECT_TRUE(vc::is_item_error(vc::ErrorCode::InferenceFailed));
  EXPECT_FALSE(vc::is_item_error(vc::ErrorCode::Unauthorized));
  EXPECT_FALSE(vc::is_item_error(vc::ErrorCode::DeliveryFailed));
  EXPECT_FALSE(vc::is_item_error(vc::ErrorCode::InvalidConfig));
}
