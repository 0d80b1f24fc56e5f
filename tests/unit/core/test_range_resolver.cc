/**
 * @file test_range_resolver.cc
 * @brief Unit tests for Range header resolution and clamping
 */

#include <gtest/gtest.h>

#include <core/range/range_resolver.h>

#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace rangeserve::core::test {

class RangeResolverTest : public ::testing::Test {
protected:
    static constexpr std::int64_t kFileSize = 1000;

    static ByteRange resolve(std::optional<std::string_view> header,
                             std::int64_t file_size = kFileSize) {
        return RangeResolver::Resolve(header, file_size);
    }
};

// Whole-file requests

TEST_F(RangeResolverTest, NoHeader_WholeFileEndUnspecified) {
    auto range = resolve(std::nullopt);
    EXPECT_EQ(range.start, 0);
    EXPECT_EQ(range.end, kFileSize - 1);
    EXPECT_FALSE(range.is_partial);
    EXPECT_TRUE(range.end_unspecified);
    EXPECT_EQ(range.length(), 1000u);
}

TEST_F(RangeResolverTest, EmptyHeader_TreatedAsAbsent) {
    auto range = resolve(std::string_view{});
    EXPECT_EQ(range.start, 0);
    EXPECT_EQ(range.end, kFileSize - 1);
    EXPECT_FALSE(range.is_partial);
    EXPECT_TRUE(range.end_unspecified);
}

// Explicit ranges

TEST_F(RangeResolverTest, ExplicitRange_ReturnedAsGiven) {
    for (auto [header, start, end] : {std::tuple{"bytes=0-0", 0, 0},
                                      std::tuple{"bytes=100-199", 100, 199},
                                      std::tuple{"bytes=0-998", 0, 998},
                                      std::tuple{"bytes=999-999", 999, 999}}) {
        SCOPED_TRACE(header);
        auto range = resolve(header);
        EXPECT_EQ(range.start, start);
        EXPECT_EQ(range.end, end);
        EXPECT_TRUE(range.is_partial);
        EXPECT_FALSE(range.end_unspecified);
    }
}

TEST_F(RangeResolverTest, OpenEndedRange_EndsAtLastByte) {
    auto range = resolve("bytes=250-");
    EXPECT_EQ(range.start, 250);
    EXPECT_EQ(range.end, kFileSize - 1);
    EXPECT_TRUE(range.is_partial);
    EXPECT_TRUE(range.end_unspecified);
    EXPECT_EQ(range.length(), 750u);
}

TEST_F(RangeResolverTest, SurroundingWhitespace_Tolerated) {
    auto range = resolve("  bytes= 10 - 20 ");
    EXPECT_EQ(range.start, 10);
    EXPECT_EQ(range.end, 20);
    EXPECT_TRUE(range.is_partial);
}

TEST_F(RangeResolverTest, EndBeyondFile_NotClampedByResolve) {
    auto range = resolve("bytes=900-2000");
    EXPECT_EQ(range.end, 2000);
}

TEST_F(RangeResolverTest, ValuesBeyondUint64_Rejected) {
    EXPECT_THROW(resolve("bytes=0-99999999999999999999999"), MalformedRangeError);
    EXPECT_THROW(resolve("bytes=18446744073709551616-"), MalformedRangeError);

    try {
        resolve("bytes=0-18446744073709551616");
        FAIL() << "expected MalformedRangeError";
    } catch (const MalformedRangeError& e) {
        EXPECT_NE(std::string(e.what()).find("invalid end"), std::string::npos);
    }
}

TEST_F(RangeResolverTest, ValuesBeyondInt64_Saturate) {
    auto range = resolve("bytes=0-18446744073709551615");
    EXPECT_EQ(range.end, std::numeric_limits<std::int64_t>::max());
    EXPECT_TRUE(RangeResolver::ClampToFile(range, kFileSize));
    EXPECT_EQ(range.end, kFileSize - 1);

    range = resolve("bytes=9223372036854775808-");
    EXPECT_EQ(range.start, std::numeric_limits<std::int64_t>::max());
    EXPECT_FALSE(RangeResolver::ClampToFile(range, kFileSize));
}

// Malformed headers

TEST_F(RangeResolverTest, MalformedHeaders_Rejected) {
    for (const char* header : {"bytes=",
                               "bytes=5",
                               "bytes=-",
                               "bytes=-500",
                               "bytes=abc-2",
                               "bytes=1-abc",
                               "bytes=1-2-3",
                               "bytes=0-1,5-6",
                               "bytes=+1-2",
                               "items=0-10",
                               "0-10",
                               "Bytes=0-10"}) {
        SCOPED_TRACE(header);
        EXPECT_THROW(resolve(header), MalformedRangeError);
    }
}

TEST_F(RangeResolverTest, MalformedHeader_MessageNamesTheProblem) {
    try {
        resolve("bytes=x-1");
        FAIL() << "expected MalformedRangeError";
    } catch (const MalformedRangeError& e) {
        EXPECT_NE(std::string(e.what()).find("invalid start"), std::string::npos);
    }
}

// Clamping and satisfiability

TEST_F(RangeResolverTest, Clamp_EndPastFilePulledBack) {
    auto range = resolve("bytes=900-2000");
    ASSERT_TRUE(RangeResolver::ClampToFile(range, kFileSize));
    EXPECT_EQ(range.start, 900);
    EXPECT_EQ(range.end, 999);
    EXPECT_EQ(range.length(), 100u);
}

TEST_F(RangeResolverTest, Clamp_EndAtLastByteUnchanged) {
    auto range = resolve("bytes=10-999");
    ASSERT_TRUE(RangeResolver::ClampToFile(range, kFileSize));
    EXPECT_EQ(range.end, 999);
}

TEST_F(RangeResolverTest, Clamp_StartPastEndUnsatisfiable) {
    auto range = resolve("bytes=1000-");
    EXPECT_FALSE(RangeResolver::ClampToFile(range, kFileSize));

    range = resolve("bytes=1500-2000");
    EXPECT_FALSE(RangeResolver::ClampToFile(range, kFileSize));

    range = resolve("bytes=20-10");
    EXPECT_FALSE(RangeResolver::ClampToFile(range, kFileSize));
}

TEST_F(RangeResolverTest, Clamp_HappensBeforeSatisfiabilityCheck) {
    // 999-5000 is only satisfiable because the end is clamped first
    auto range = resolve("bytes=999-5000");
    EXPECT_TRUE(RangeResolver::ClampToFile(range, kFileSize));
    EXPECT_EQ(range.length(), 1u);
}

TEST_F(RangeResolverTest, EmptyFile_WholeFileSatisfiableWithZeroLength) {
    auto range = resolve(std::nullopt, 0);
    EXPECT_TRUE(RangeResolver::ClampToFile(range, 0));
    EXPECT_EQ(range.length(), 0u);
}

TEST_F(RangeResolverTest, EmptyFile_AnyRangeUnsatisfiable) {
    auto range = resolve("bytes=0-", 0);
    EXPECT_FALSE(RangeResolver::ClampToFile(range, 0));
}

} // namespace rangeserve::core::test
