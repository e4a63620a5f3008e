#include <gtest/gtest.h>

#include "util/path_utils.hpp"

TEST(PathUtilsTest, NormalizeTarPathCleansInput) {
    EXPECT_EQ(xfer::NormalizeTarPath("./notes.txt"), "notes.txt");
    EXPECT_EQ(xfer::NormalizeTarPath("/photos//2024///trip"), "photos/2024/trip");
    EXPECT_EQ(xfer::NormalizeTarPath("////././a//./b"), "a/b");
    EXPECT_EQ(xfer::NormalizeTarPath("docs/"), "docs");
    EXPECT_EQ(xfer::NormalizeTarPath("./"), "");
    EXPECT_EQ(xfer::NormalizeTarPath(""), "");
}

TEST(PathUtilsTest, NormalizeTarPathKeepsParentSegments) {
    EXPECT_EQ(xfer::NormalizeTarPath("a/../b"), "a/../b");
    EXPECT_EQ(xfer::NormalizeTarPath("/../etc"), "../etc");
}
