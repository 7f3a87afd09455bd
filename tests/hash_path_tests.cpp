#include "spvmerkle/hash_path.hpp"
#include "spvmerkle/merkle_tree.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace spvmerkle;

TEST(HashPath, BufferLayout) {
  Digest l{};
  Digest r{};
  l.fill(0xAA);
  r.fill(0x55);
  HashPath path(std::vector<HashPath::Pair>{{l, r}});

  auto buf = path.toBuffer();
  ASSERT_EQ(buf.size(), 4u + 64u);
  EXPECT_EQ(buf[0], 0);
  EXPECT_EQ(buf[3], 1);
  EXPECT_EQ(buf[4], 0xAA);
  EXPECT_EQ(buf[4 + 32], 0x55);
}

TEST(HashPath, TreePathSurvivesBuffer) {
  MerkleTree tree(6);
  tree.loadLeaves(spvmerkle::test::makeLeaves(8));
  tree.build();
  HashPath path = tree.getHashPath(5);

  HashPath restored = HashPath::fromBuffer(path.toBuffer());
  EXPECT_EQ(restored, path);
  EXPECT_EQ(restored.size(), 6u);
  EXPECT_EQ(restored.pairs(), path.pairs());

  EXPECT_NE(restored, tree.getHashPath(2));
  EXPECT_TRUE(restored != HashPath());
}

TEST(HashPath, RejectsMalformedBuffers) {
  EXPECT_THROW(HashPath::fromBuffer({0, 0}), std::runtime_error);

  Digest d{};
  auto buf = HashPath(std::vector<HashPath::Pair>{{d, d}, {d, d}}).toBuffer();
  auto truncated = buf;
  truncated.pop_back();
  EXPECT_THROW(HashPath::fromBuffer(truncated), std::runtime_error);

  auto trailing = buf;
  trailing.push_back(0);
  EXPECT_THROW(HashPath::fromBuffer(trailing), std::runtime_error);

  EXPECT_TRUE(HashPath::fromBuffer({0, 0, 0, 0}).empty());
}
