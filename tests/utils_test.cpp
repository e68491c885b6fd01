#include "utils.hpp"
#include "exceptions.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

using core::utils::stringToTimestamp;
using core::utils::timestampToString;

TEST(UtilsTest, BareDateIsMidnightUtc) {
    auto ts = stringToTimestamp("2023-03-15");
    EXPECT_EQ(timestampToString(ts), "2023-03-15T00:00:00Z");
}

TEST(UtilsTest, OffsetIsConvertedToUtc) {
    auto ts = stringToTimestamp("2023-03-15T10:30:00+05:30");
    EXPECT_EQ(timestampToString(ts), "2023-03-15T05:00:00Z");

    auto west = stringToTimestamp("2023-03-15T22:00:00-03:00");
    EXPECT_EQ(timestampToString(west), "2023-03-16T01:00:00Z");
}

TEST(UtilsTest, ZuluAndNoIndicatorAgree) {
    EXPECT_EQ(stringToTimestamp("2023-03-15T10:30:00Z"), stringToTimestamp("2023-03-15T10:30:00"));
}

TEST(UtilsTest, FractionalSecondsArePreserved) {
    auto whole = stringToTimestamp("2023-03-15T10:30:00Z");
    auto frac = stringToTimestamp("2023-03-15T10:30:00.250Z");
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(frac - whole).count(), 250);
}

TEST(UtilsTest, MalformedTimestampThrows) {
    EXPECT_THROW(stringToTimestamp("not-a-date"), std::runtime_error);
    EXPECT_THROW(stringToTimestamp("2023-03-15T10:30:00X"), std::runtime_error);
}

TEST(UtilsTest, DurationToDays) {
    EXPECT_DOUBLE_EQ(core::utils::durationToDays(std::chrono::hours(36)), 1.5);
    EXPECT_DOUBLE_EQ(core::utils::durationToDays(core::Duration{}), 0.0);
}

TEST(UtilsTest, EnumNames) {
    EXPECT_EQ(core::utils::toString(core::OrderSide::Buy), "BUY");
    EXPECT_EQ(core::utils::toString(core::OrderType::StopLimit), "STOP_LIMIT");
    EXPECT_EQ(core::utils::toString(core::OrderStatus::Rejected), "REJECTED");
}

TEST(OrderRequestTest, ValidRequestsConstruct) {
    EXPECT_NO_THROW(core::OrderRequest("X", core::OrderSide::Buy, 10));
    EXPECT_NO_THROW(core::OrderRequest("X", core::OrderSide::Buy, 10, core::OrderType::Limit, 95.0));
    EXPECT_NO_THROW(core::OrderRequest("X", core::OrderSide::Sell, 10, core::OrderType::Stop, std::nullopt, 90.0));
    EXPECT_NO_THROW(core::OrderRequest("X", core::OrderSide::Sell, 10, core::OrderType::StopLimit, 89.0, 90.0));
}

TEST(OrderRequestTest, StructuralMisuseIsRejected) {
    using core::OrderValidationException;
    EXPECT_THROW(core::OrderRequest("", core::OrderSide::Buy, 10), OrderValidationException);
    EXPECT_THROW(core::OrderRequest("X", core::OrderSide::Buy, 0), OrderValidationException);
    EXPECT_THROW(core::OrderRequest("X", core::OrderSide::Buy, -5), OrderValidationException);
    EXPECT_THROW(core::OrderRequest("X", core::OrderSide::Buy, 10, core::OrderType::Limit), OrderValidationException);
    EXPECT_THROW(core::OrderRequest("X", core::OrderSide::Buy, 10, core::OrderType::Stop, 95.0), OrderValidationException);
    EXPECT_THROW(core::OrderRequest("X", core::OrderSide::Buy, 10, core::OrderType::StopLimit, std::nullopt, 95.0),
                 OrderValidationException);
}
