/**
 * @file test_version.cpp
 * @brief Unit tests for version information
 */

#include <gtest/gtest.h>
#include <kcenon/bulk_upload/bulk_upload.h>

namespace kcenon::bulk_upload::test {

TEST(VersionTest, VersionStringIsCorrect) {
    EXPECT_EQ(version::to_string(), "0.1.0");
}

TEST(VersionTest, VersionStringFormat) {
    auto ver = version::to_string();
    EXPECT_FALSE(ver.empty());
    EXPECT_NE(ver.find('.'), std::string::npos);
}

}  // namespace kcenon::bulk_upload::test
