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

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <system_error>
#include <tuple>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "bptree.hpp"
#include "bulk_load.hpp"
#include "ext_hash.hpp"
#include "gtest_utils.hpp"
#include "index_test_utils.hpp"

namespace {

using splitidx::test::i64_bptree;
using splitidx::test::i64_ext_hash;

template <class Index>
class BulkLoadTest : public ::testing::Test {
 public:
  using Test::Test;
};

using IndexTypes = ::testing::Types<i64_bptree, i64_ext_hash>;

SPLITIDX_TYPED_TEST_SUITE(BulkLoadTest, IndexTypes)

SPLITIDX_TEST(BulkLoad, Trim) {
  SPLITIDX_ASSERT_EQ(splitidx::detail::trim("  42\t\r"), "42");
  SPLITIDX_ASSERT_EQ(splitidx::detail::trim("7"), "7");
  SPLITIDX_ASSERT_EQ(splitidx::detail::trim(" \t "), "");
  SPLITIDX_ASSERT_EQ(splitidx::detail::trim(""), "");
}

SPLITIDX_TEST(BulkLoad, ParseKey) {
  using splitidx::detail::parse_key;
  SPLITIDX_ASSERT_EQ(parse_key<std::int64_t>("-17"), -17);
  SPLITIDX_ASSERT_EQ(parse_key<std::int64_t>("9223372036854775807"),
                     INT64_MAX);
  SPLITIDX_ASSERT_FALSE(parse_key<std::int64_t>("9223372036854775808"));
  SPLITIDX_ASSERT_FALSE(parse_key<std::int64_t>("12abc"));
  SPLITIDX_ASSERT_FALSE(parse_key<std::int64_t>("1 2"));
  SPLITIDX_ASSERT_FALSE(parse_key<std::int64_t>("3.5"));
  SPLITIDX_ASSERT_FALSE(parse_key<std::int64_t>("x"));

  SPLITIDX_ASSERT_EQ(parse_key<std::int64_t>("+5"), 5);
  SPLITIDX_ASSERT_EQ(parse_key<std::int64_t>("+0"), 0);
  SPLITIDX_ASSERT_FALSE(parse_key<std::int64_t>("+-5"));
  SPLITIDX_ASSERT_FALSE(parse_key<std::int64_t>("++5"));
  SPLITIDX_ASSERT_FALSE(parse_key<std::int64_t>("+"));
  SPLITIDX_ASSERT_FALSE(parse_key<std::int64_t>("-+5"));
}

SPLITIDX_TYPED_TEST(BulkLoadTest, LoadStream) {
  TypeParam index;
  std::istringstream in{"5\n  3 \n\nfoo\n5\n-8\n\t\n12x\n7"};

  ::testing::internal::CaptureStderr();
  const auto stats = splitidx::load_keys(index, in);
  const auto log = ::testing::internal::GetCapturedStderr();

  SPLITIDX_ASSERT_EQ(stats.inserted, 4);
  SPLITIDX_ASSERT_EQ(stats.duplicates, 1);
  SPLITIDX_ASSERT_EQ(stats.malformed, 2);
  SPLITIDX_ASSERT_EQ(stats.blank, 2);
  SPLITIDX_ASSERT_EQ(index.size(), 4);
  for (const std::int64_t k : {5, 3, -8, 7}) {
    const auto result = index.get(k);
    SPLITIDX_ASSERT_TRUE(TypeParam::key_found(result));
    SPLITIDX_ASSERT_EQ(*result, k);
  }
  SPLITIDX_ASSERT_THAT(log, ::testing::HasSubstr("line 4: \"foo\""));
  SPLITIDX_ASSERT_THAT(log, ::testing::HasSubstr("line 8: \"12x\""));
}

SPLITIDX_TYPED_TEST(BulkLoadTest, LeadingPlusSign) {
  TypeParam index;
  std::istringstream in{"+5\n7\n +9 \n+-3\n"};

  ::testing::internal::CaptureStderr();
  const auto stats = splitidx::load_keys(index, in);
  const auto log = ::testing::internal::GetCapturedStderr();

  SPLITIDX_ASSERT_EQ(stats, (splitidx::load_stats{3, 0, 1, 0}));
  SPLITIDX_ASSERT_EQ(index.get(5), 5);
  SPLITIDX_ASSERT_EQ(index.get(9), 9);
  SPLITIDX_ASSERT_THAT(log, ::testing::HasSubstr("line 4: \"+-3\""));
}

SPLITIDX_TYPED_TEST(BulkLoadTest, LoadFile) {
  const auto path =
      std::filesystem::temp_directory_path() /
      ("splitidx_keys_" + std::to_string(std::random_device{}()) + ".txt");
  {
    std::ofstream out{path};
    for (auto k = 100; k > 0; --k) out << k << '\n';
  }

  TypeParam index;
  const auto stats = splitidx::load_keys_from_file(index, path);
  std::filesystem::remove(path);

  SPLITIDX_ASSERT_EQ(stats, (splitidx::load_stats{100, 0, 0, 0}));
  SPLITIDX_ASSERT_EQ(index.size(), 100);
}

SPLITIDX_TYPED_TEST(BulkLoadTest, MissingFileThrows) {
  TypeParam index;
  const auto path = std::filesystem::temp_directory_path() /
                    "splitidx_no_such_dir" / "keys.txt";
  SPLITIDX_ASSERT_THROW(
      std::ignore = splitidx::load_keys_from_file(index, path),
      std::system_error);
  SPLITIDX_ASSERT_TRUE(index.empty());
}

}  // namespace
