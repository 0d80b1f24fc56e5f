/**
 * @file test_human_readable.cc
 * @brief Unit tests for byte and duration formatting
 */

#include <gtest/gtest.h>

#include <core/util/human_readable.h>

#include <chrono>
#include <cstdint>

namespace rangeserve::core::test {

using namespace std::chrono_literals;

TEST(HumanReadableBytesTest, WholeBytesHaveNoDecimals) {
    EXPECT_EQ(human_readable::Bytes(0), "0 B");
    EXPECT_EQ(human_readable::Bytes(1), "1 B");
    EXPECT_EQ(human_readable::Bytes(1023), "1023 B");
}

TEST(HumanReadableBytesTest, LargerUnitsHaveOneDecimal) {
    EXPECT_EQ(human_readable::Bytes(1024), "1.0 KiB");
    EXPECT_EQ(human_readable::Bytes(1536), "1.5 KiB");
    EXPECT_EQ(human_readable::Bytes(100 * 1024 * 1024), "100.0 MiB");
    EXPECT_EQ(human_readable::Bytes(1073741824), "1.0 GiB");
    EXPECT_EQ(human_readable::Bytes(1ULL << 40), "1.0 TiB");
}

TEST(HumanReadableBytesTest, PiBIsTheLargestUnit) {
    EXPECT_EQ(human_readable::Bytes(1ULL << 50), "1.0 PiB");
    EXPECT_EQ(human_readable::Bytes(1ULL << 60), "1024.0 PiB");
}

TEST(HumanReadableDurationTest, Zero) {
    EXPECT_EQ(human_readable::Duration(0ns), "0s");
}

TEST(HumanReadableDurationTest, SubSecondUnits) {
    EXPECT_EQ(human_readable::Duration(1ns), "1ns");
    EXPECT_EQ(human_readable::Duration(999ns), "999ns");
    EXPECT_EQ(human_readable::Duration(1500ns), "1.5µs");
    EXPECT_EQ(human_readable::Duration(1ms), "1ms");
    EXPECT_EQ(human_readable::Duration(12345678ns), "12.345678ms");
}

TEST(HumanReadableDurationTest, SecondsMinutesHours) {
    EXPECT_EQ(human_readable::Duration(1s), "1s");
    EXPECT_EQ(human_readable::Duration(1500ms), "1.5s");
    EXPECT_EQ(human_readable::Duration(123500ms), "2m3.5s");
    EXPECT_EQ(human_readable::Duration(1h), "1h0m0s");
    EXPECT_EQ(human_readable::Duration(3661s + 1ns), "1h1m1.000000001s");
}

TEST(HumanReadableDurationTest, Negative) {
    EXPECT_EQ(human_readable::Duration(-1500ms), "-1.5s");
}

} // namespace rangeserve::core::test
