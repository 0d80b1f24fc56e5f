/**
 * @file test_url.cc
 * @brief Unit tests for request-target decoding and file path mapping
 */

#include <gtest/gtest.h>

#include <core/util/url.h>

#include <boost/url/parse.hpp>

#include <string_view>

namespace rangeserve::core::test {

namespace {

boost::urls::url_view ParseTarget(std::string_view target) {
    auto parsed = boost::urls::parse_origin_form(target);
    EXPECT_TRUE(parsed.has_value()) << target;
    return parsed.has_value() ? *parsed : boost::urls::url_view();
}

} // namespace

TEST(UrlTest, Target_PathIsPercentDecoded) {
    auto target = ParseTarget("/getfile/sub%20dir/%e4%BD%a0.bin?convert_id=42");
    EXPECT_EQ(target.path(), "/getfile/sub dir/\xe4\xbd\xa0.bin");
}

TEST(UrlTest, Target_MalformedEscapeRejected) {
    EXPECT_FALSE(boost::urls::parse_origin_form("/getfile/abc%2?convert_id=1").has_value());
    EXPECT_FALSE(boost::urls::parse_origin_form("/getfile/%zz?convert_id=1").has_value());
}

TEST(UrlTest, QueryParam_FirstValueWins) {
    auto target = ParseTarget("/getinfo?convert_id=first&convert_id=second");
    EXPECT_EQ(url::QueryParam(target, "convert_id"), "first");
}

TEST(UrlTest, QueryParam_DecodesValues) {
    auto target = ParseTarget("/getinfo?x=1&convert_id=job%207%2Fa");
    EXPECT_EQ(url::QueryParam(target, "convert_id"), "job 7/a");
    EXPECT_EQ(url::QueryParam(target, "x"), "1");
}

TEST(UrlTest, QueryParam_BareAndEmptyKeys) {
    auto target = ParseTarget("/getinfo?flag&empty=");
    EXPECT_EQ(url::QueryParam(target, "flag"), "");
    EXPECT_EQ(url::QueryParam(target, "empty"), "");
}

TEST(UrlTest, QueryParam_Absent) {
    EXPECT_FALSE(url::QueryParam(ParseTarget("/getinfo"), "convert_id"));
    EXPECT_FALSE(url::QueryParam(ParseTarget("/getinfo?other=1"), "convert_id"));
}

TEST(UrlTest, ResolveFilePath_UnderRoot) {
    auto path = url::ResolveFilePath("/srv/files", "/videos/clip.mp4");
    ASSERT_TRUE(path);
    EXPECT_EQ(*path, std::filesystem::path("/srv/files/videos/clip.mp4"));
}

TEST(UrlTest, ResolveFilePath_AbsoluteWithDefaultRoot) {
    auto path = url::ResolveFilePath("/", "/tmp/data.bin");
    ASSERT_TRUE(path);
    EXPECT_EQ(*path, std::filesystem::path("/tmp/data.bin"));
}

TEST(UrlTest, ResolveFilePath_NormalisesDotsAndSlashes) {
    auto path = url::ResolveFilePath("/srv", "//a/./b//c.txt");
    ASSERT_TRUE(path);
    EXPECT_EQ(*path, std::filesystem::path("/srv/a/b/c.txt"));
}

TEST(UrlTest, ResolveFilePath_RejectsParentSegments) {
    EXPECT_FALSE(url::ResolveFilePath("/srv", "/../etc/passwd"));
    EXPECT_FALSE(url::ResolveFilePath("/srv", "/a/../../etc/passwd"));
    EXPECT_FALSE(url::ResolveFilePath("/srv", "/a/.."));
}

TEST(UrlTest, ResolveFilePath_DotsInsideNamesAllowed) {
    auto path = url::ResolveFilePath("/srv", "/archive..tar");
    ASSERT_TRUE(path);
    EXPECT_EQ(*path, std::filesystem::path("/srv/archive..tar"));
}

TEST(UrlTest, ResolveFilePath_RejectsEmpty) {
    EXPECT_FALSE(url::ResolveFilePath("/srv", ""));
    EXPECT_FALSE(url::ResolveFilePath("/srv", "/"));
}

} // namespace rangeserve::core::test
