// SPDX-License-Identifier: MIT
// Unit tests for numeric-suffix neighbor lookup

#include <gtest/gtest.h>
#include "ViewportStreaming/Internal/Adjacency.h"

#include <string>
#include <vector>

namespace vp_stream {
namespace test {

using Ids = std::vector<std::string>;

TEST(AdjacencyTest, NeighborsOfNumberedId) {
    EXPECT_EQ(internal::adjacentIds("viewport-3"), (Ids{"viewport-2", "viewport-4"}));
}

TEST(AdjacencyTest, ZeroHasNoLowerNeighbor) {
    EXPECT_EQ(internal::adjacentIds("viewport-0"), (Ids{"viewport-1"}));
}

TEST(AdjacencyTest, ZeroPaddingIsKept) {
    EXPECT_EQ(internal::adjacentIds("vp07"), (Ids{"vp06", "vp08"}));
    EXPECT_EQ(internal::adjacentIds("vp09"), (Ids{"vp08", "vp10"}));
}

TEST(AdjacencyTest, GrowsPastPaddedWidth) {
    EXPECT_EQ(internal::adjacentIds("vp99"), (Ids{"vp98", "vp100"}));
}

TEST(AdjacencyTest, NoSuffixNoNeighbors) {
    EXPECT_TRUE(internal::adjacentIds("axial").empty());
    EXPECT_TRUE(internal::adjacentIds("").empty());
}

TEST(AdjacencyTest, OverlongSuffixIsIgnored) {
    EXPECT_TRUE(internal::adjacentIds("vp-1234567890123456789").empty());
}

TEST(AdjacencyTest, BareNumber) {
    EXPECT_EQ(internal::adjacentIds("5"), (Ids{"4", "6"}));
}

}  // namespace test
}  // namespace vp_stream
