/**
 * @file test_version.cpp
 * @brief Unit tests for version information
 */

#include <gtest/gtest.h>
#include <kcenon/file_stream/file_stream.h>

namespace kcenon::file_stream::test {

class VersionTest : public ::testing::Test {};

TEST_F(VersionTest, VersionComponents) {
    EXPECT_EQ(version::major, 0);
    EXPECT_EQ(version::minor, 1);
    EXPECT_EQ(version::patch, 0);
}

TEST_F(VersionTest, VersionStringIsCorrect) {
    EXPECT_EQ(version::to_string(), "0.1.0");
}

}  // namespace kcenon::file_stream::test
