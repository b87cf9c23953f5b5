// Copyright 2025-2026 SplitIdx contributors

//
// CAUTION: [global.hpp] MUST BE THE FIRST INCLUDE IN ALL SOURCE AND
// HEADER FILES !!!
//
// This header defines _GLIBCXX_DEBUG and _GLIBCXX_DEBUG_PEDANTIC for
// DEBUG builds.  If some standard headers are included before and
// after those symbols are defined, then that results in different
// container internal structure layouts and that is Not Good.
#include "global.hpp"  // IWYU pragma: keep

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "bptree.hpp"
#include "gtest_utils.hpp"
#include "index_test_utils.hpp"
#include "node_type.hpp"

namespace {

using splitidx::test::bptree_verifier;
using splitidx::test::i64_bptree;

class BPTreeOrderTest : public ::testing::TestWithParam<std::size_t> {};

SPLITIDX_TEST(BPTree, EmptyTree) {
  const bptree_verifier<i64_bptree> verifier;
  verifier.check_absent_keys({0, 1, -1});
  verifier.check_structure();
  SPLITIDX_ASSERT_EQ(verifier.get_tree().order(), 4);
}

SPLITIDX_TEST(BPTree, SingleKey) {
  bptree_verifier<i64_bptree> verifier;
  verifier.insert(1, 100);

  verifier.check_present_values();
  verifier.check_absent_keys({0, 2});
  verifier.check_structure();
  SPLITIDX_ASSERT_EQ(verifier.get_tree().height(), 1);
}

SPLITIDX_TEST(BPTree, FirstLeafSplit) {
  bptree_verifier<i64_bptree> verifier;
  verifier.insert_key_range(1, 3);
  verifier.assert_leaf_keys({{1, 2, 3}});
  SPLITIDX_ASSERT_EQ(verifier.get_tree().height(), 1);

  // The fourth key brings the leaf to the order and splits it
  verifier.insert(4, 4);
  verifier.assert_leaf_keys({{1, 2}, {3, 4}});
  verifier.check_structure();

  const auto &tree = verifier.get_tree();
  SPLITIDX_ASSERT_EQ(tree.height(), 2);
  const auto &root = tree.get_node(tree.root());
  SPLITIDX_ASSERT_FALSE(root.is_leaf());
  SPLITIDX_ASSERT_EQ(root.type(), splitidx::node_type::INTERNAL);
  SPLITIDX_ASSERT_THAT(root.keys(), ::testing::ElementsAre(3));
  SPLITIDX_ASSERT_EQ(root.children().size(), 2);
  SPLITIDX_ASSERT_EQ(root.children().front(), tree.first_leaf());

#ifdef SPLITIDX_DETAIL_WITH_STATS
  verifier.assert_node_counts({2, 1});
  SPLITIDX_ASSERT_EQ(tree.get_leaf_splits(), 1);
  SPLITIDX_ASSERT_EQ(tree.get_inode_splits(), 0);
  SPLITIDX_ASSERT_EQ(tree.get_root_splits(), 1);
#endif  // SPLITIDX_DETAIL_WITH_STATS
}

SPLITIDX_TEST(BPTree, InsertAfterFirstSplitDoesNotSplit) {
  bptree_verifier<i64_bptree> verifier;
  verifier.insert_key_range(1, 5);

  verifier.assert_leaf_keys({{1, 2}, {3, 4, 5}});
  verifier.check_structure();
  verifier.check_present_values();
  const auto &tree = verifier.get_tree();
  SPLITIDX_ASSERT_THAT(tree.get_node(tree.root()).keys(),
                       ::testing::ElementsAre(3));
}

SPLITIDX_TEST(BPTree, SeparatorKeyRoutesRight) {
  bptree_verifier<i64_bptree> verifier;
  verifier.insert_key_range(1, 4);

  // 3 is the root separator and lives in the right leaf
  const auto &tree = verifier.get_tree();
  const auto right_leaf = tree.get_node(tree.root()).children()[1];
  SPLITIDX_ASSERT_THAT(tree.get_node(right_leaf).keys(),
                       ::testing::ElementsAre(3, 4));
  const auto result = tree.get(3);
  SPLITIDX_ASSERT_TRUE(i64_bptree::key_found(result));
  SPLITIDX_ASSERT_EQ(*result, 3);
}

SPLITIDX_TEST(BPTree, SecondLeafSplit) {
  bptree_verifier<i64_bptree> verifier;
  verifier.insert_key_range(1, 6);

  verifier.assert_leaf_keys({{1, 2}, {3, 4}, {5, 6}});
  verifier.check_structure();
  const auto &tree = verifier.get_tree();
  SPLITIDX_ASSERT_THAT(tree.get_node(tree.root()).keys(),
                       ::testing::ElementsAre(3, 5));
  SPLITIDX_ASSERT_EQ(tree.height(), 2);
}

SPLITIDX_TEST(BPTree, CascadingSplitGrowsRoot) {
  bptree_verifier<i64_bptree> verifier;
  // Ascending keys split a leaf every two inserts. The root reaches four
  // separators at key 10.
  verifier.insert_key_range(1, 9);
  SPLITIDX_ASSERT_EQ(verifier.get_tree().height(), 2);

  verifier.insert(10, 10);
  verifier.check_structure();
  verifier.check_present_values();

  const auto &tree = verifier.get_tree();
  SPLITIDX_ASSERT_EQ(tree.height(), 3);
  const auto &root = tree.get_node(tree.root());
  SPLITIDX_ASSERT_THAT(root.keys(), ::testing::ElementsAre(7));
  SPLITIDX_ASSERT_THAT(tree.get_node(root.children()[0]).keys(),
                       ::testing::ElementsAre(3, 5));
  SPLITIDX_ASSERT_THAT(tree.get_node(root.children()[1]).keys(),
                       ::testing::ElementsAre(9));
  verifier.assert_leaf_keys({{1, 2}, {3, 4}, {5, 6}, {7, 8}, {9, 10}});

#ifdef SPLITIDX_DETAIL_WITH_STATS
  SPLITIDX_ASSERT_EQ(tree.get_leaf_splits(), 4);
  SPLITIDX_ASSERT_EQ(tree.get_inode_splits(), 1);
  SPLITIDX_ASSERT_EQ(tree.get_root_splits(), 2);
#endif  // SPLITIDX_DETAIL_WITH_STATS
}

SPLITIDX_TEST(BPTree, DuplicateRejectedWithoutChange) {
  bptree_verifier<i64_bptree> verifier;
  verifier.insert_key_range(1, 4);
  verifier.insert_duplicate(1, 111);
  verifier.insert_duplicate(3, 333);
  verifier.insert_duplicate(4, 444);

  verifier.check_present_values();
  verifier.check_structure();
  verifier.assert_leaf_keys({{1, 2}, {3, 4}});
}

SPLITIDX_TEST(BPTree, NegativeKeys) {
  bptree_verifier<i64_bptree> verifier;
  for (std::int64_t k = -1; k >= -20; --k) verifier.insert(k, k * 10);

  verifier.check_present_values();
  verifier.check_absent_keys({0, -21, 1});
  verifier.check_structure();
}

SPLITIDX_TEST(BPTree, DescendingKeys) {
  bptree_verifier<i64_bptree> verifier;
  for (std::int64_t k = 200; k > 0; --k) verifier.insert(k, -k);

  verifier.check_present_values();
  verifier.check_structure();
}

SPLITIDX_TEST(BPTree, InvalidOrder) {
  SPLITIDX_ASSERT_THROW(i64_bptree{0}, std::invalid_argument);
  SPLITIDX_ASSERT_THROW(i64_bptree{1}, std::invalid_argument);
  SPLITIDX_ASSERT_THROW(i64_bptree{2}, std::invalid_argument);
}

SPLITIDX_TEST(BPTree, Dump) {
  bptree_verifier<i64_bptree> verifier;
  verifier.insert_key_range(1, 4);

  std::ostringstream dump;
  verifier.get_tree().dump(dump);
  const auto text = dump.str();
  SPLITIDX_EXPECT_TRUE(text.find("order = 4") != std::string::npos);
  SPLITIDX_EXPECT_TRUE(text.find("I[3]") != std::string::npos);
  SPLITIDX_EXPECT_TRUE(text.find("  L[1, 2]") != std::string::npos);
  SPLITIDX_EXPECT_TRUE(text.find("  L[3, 4]") != std::string::npos);
}

TEST_P(BPTreeOrderTest, AscendingKeys) {
  bptree_verifier<i64_bptree> verifier{GetParam()};
  verifier.insert_key_range(0, 500);

  verifier.check_present_values();
  verifier.check_absent_keys({-1, 500});
  verifier.check_structure();
}

TEST_P(BPTreeOrderTest, RandomKeys) {
  bptree_verifier<i64_bptree> verifier{GetParam()};
  std::mt19937_64 gen{GetParam()};
  std::uniform_int_distribution<std::int64_t> dist{-100000, 100000};

  std::vector<std::int64_t> inserted;
  for (auto i = 0; i < 1000; ++i) {
    const auto k = dist(gen);
    if (std::find(inserted.cbegin(), inserted.cend(), k) != inserted.cend()) {
      verifier.insert_duplicate(k, 0);
      continue;
    }
    verifier.insert(k, k ^ 0x5A5A);
    inserted.push_back(k);
    if (i % 100 == 0) verifier.check_structure();
  }

  verifier.check_present_values();
  verifier.check_structure();
}

TEST_P(BPTreeOrderTest, ShuffledKeysInOrderLeafChain) {
  bptree_verifier<i64_bptree> verifier{GetParam()};
  std::vector<std::int64_t> keys(300);
  for (std::size_t i = 0; i < keys.size(); ++i)
    keys[i] = static_cast<std::int64_t>(i) * 3;
  std::shuffle(keys.begin(), keys.end(), std::mt19937_64{42});

  for (const auto k : keys) verifier.insert(k, k);

  verifier.check_structure();
  verifier.check_absent_keys({1, 2, 4, 899, 900});
}

INSTANTIATE_TEST_SUITE_P(Orders, BPTreeOrderTest,
                         ::testing::Values(3, 4, 5, 8, 32));

}  // namespace
