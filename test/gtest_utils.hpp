// Copyright 2025-2026 SplitIdx contributors
#ifndef SPLITIDX_DETAIL_GTEST_UTILS_HPP
#define SPLITIDX_DETAIL_GTEST_UTILS_HPP

/// \file
/// Google Test wrapper macros.
///
/// \ingroup test-internals
///
/// These macros wrap Google Test functionality while suppressing various
/// compiler and static analysis warnings. Use these macros instead of direct
/// Google Test macros in SplitIdx tests.

// Should be the first include
#include "global.hpp"

#include <gtest/gtest.h>

/// \addtogroup test-internals
/// \{

/// \name Google Test wrapper macros
/// \{

/// Wrapper for Google Test `TYPED_TEST_SUITE` macro.
// Empty variadic macro arguments trip -Wgnu-zero-variadic-macro-arguments:
// https://github.com/google/googletest/issues/2271
#define SPLITIDX_TYPED_TEST_SUITE(Suite, Types)                                \
  SPLITIDX_DETAIL_DISABLE_CLANG_WARNING("-Wgnu-zero-variadic-macro-arguments") \
  TYPED_TEST_SUITE(Suite, Types);                                              \
  SPLITIDX_DETAIL_RESTORE_CLANG_WARNINGS()

/// Wrapper for Google Test `TEST` macro.
#define SPLITIDX_TEST(Suite, Test)            \
  SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26409) \
  SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26426) \
  SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26440) \
  SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26455) \
  TEST(Suite, Test)                           \
  SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()     \
  SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()     \
  SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()     \
  SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()

/// Wrapper for Google Test `TEST_F` macro.
#define SPLITIDX_TEST_F(Suite, Test)          \
  SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26409) \
  SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26426) \
  SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26455) \
  TEST_F(Suite, Test)                         \
  SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()     \
  SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()     \
  SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()

/// Wrapper for Google Test `TYPED_TEST` macro.
#define SPLITIDX_TYPED_TEST(Suite, Test)      \
  SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26426) \
  TYPED_TEST(Suite, Test)                     \
  SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()

/// Wrapper for Google Test `ASSERT_EQ` macro.
#define SPLITIDX_ASSERT_EQ(x, y)                \
  do {                                          \
    SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(6326)  \
    SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26818) \
    ASSERT_EQ((x), (y));                        \
    SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()     \
    SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()     \
  } while (0)

/// Wrapper for Google Test `ASSERT_FALSE` macro.
#define SPLITIDX_ASSERT_FALSE(cond)             \
  do {                                          \
    SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(6326)  \
    SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26818) \
    ASSERT_FALSE(cond);                         \
    SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()     \
    SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()     \
  } while (0)

/// Wrapper for Google Test `ASSERT_GT` macro.
#define SPLITIDX_ASSERT_GT(val1, val2)          \
  do {                                          \
    SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(6326)  \
    SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26818) \
    ASSERT_GT((val1), (val2));                  \
    SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()     \
    SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()     \
  } while (0)

/// Wrapper for Google Test `ASSERT_LT` macro.
#define SPLITIDX_ASSERT_LT(val1, val2)          \
  do {                                          \
    SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(6326)  \
    SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26818) \
    ASSERT_LT((val1), (val2));                  \
    SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()     \
    SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()     \
  } while (0)

/// Wrapper for Google Test `ASSERT_THAT` macro.
#define SPLITIDX_ASSERT_THAT(value, matcher)    \
  do {                                          \
    SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(6326)  \
    SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26818) \
    ASSERT_THAT((value), (matcher));            \
    SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()     \
    SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()     \
  } while (0)

/// Wrapper for Google Test `ASSERT_THROW` macro.
#define SPLITIDX_ASSERT_THROW(statement, expected_exception) \
  do {                                                       \
    SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(6326)               \
    SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26818)              \
    ASSERT_THROW(statement, expected_exception);             \
    SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()                  \
    SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()                  \
  } while (0)

/// Wrapper for Google Test `ASSERT_TRUE` macro.
#define SPLITIDX_ASSERT_TRUE(cond)              \
  do {                                          \
    SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(6326)  \
    SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26818) \
    ASSERT_TRUE(cond);                          \
    SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()     \
    SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()     \
  } while (0)

/// Wrapper for Google Test `EXPECT_TRUE` macro.
// Do not wrap in a block to support streaming to EXPECT_TRUE. Happens to be OK
// because the warning macros are not statements.
#define SPLITIDX_EXPECT_TRUE(cond)            \
  SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(6326)  \
  SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26818) \
  EXPECT_TRUE(cond)                           \
  SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()     \
  SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()

/// \}

/// \}

#endif  // SPLITIDX_DETAIL_GTEST_UTILS_HPP
