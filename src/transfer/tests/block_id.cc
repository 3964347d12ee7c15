#include <set>

#include <gtest/gtest.h>

#include "transfer/block_id.h"

namespace dxfer {
namespace transfer {
namespace tests {

TEST(BlockId, KnownValues) {
  EXPECT_EQ("AAAAAA==", BlockId::FromIndex(0));
  EXPECT_EQ("AQAAAA==", BlockId::FromIndex(1));
  EXPECT_EQ("AAEAAA==", BlockId::FromIndex(256));
  EXPECT_EQ("/////w==", BlockId::FromIndex(0xffffffff));
}

TEST(BlockId, SameLengthAndDistinct) {
  auto ids = BlockId::Sequence(50000);
  std::set<std::string> unique(ids.begin(), ids.end());

  ASSERT_EQ(50000u, ids.size());
  EXPECT_EQ(ids.size(), unique.size());

  for (const auto &id : ids) ASSERT_EQ(8u, id.size()) << id;
}

TEST(BlockId, SequenceIsAscending) {
  auto ids = BlockId::Sequence(20);

  ASSERT_EQ(20u, ids.size());
  for (uint32_t i = 0; i < 20; i++) EXPECT_EQ(BlockId::FromIndex(i), ids[i]);

  EXPECT_TRUE(BlockId::Sequence(0).empty());
}

}  // namespace tests
}  // namespace transfer
}  // namespace dxfer
