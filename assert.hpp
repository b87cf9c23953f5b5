// Copyright 2025-2026 SplitIdx contributors
#ifndef SPLITIDX_DETAIL_ASSERT_HPP
#define SPLITIDX_DETAIL_ASSERT_HPP

/// \file assert.hpp
/// \brief Internal macros for assertions, assumptions & intentional crashing
///
/// If compiling as a part of another project, they will expand to C++ standard
/// symbols (assert & std::abort). Otherwise, custom implementations are
/// used that will show stacktraces if Boost.Stacktrace is available.

//
// CAUTION: [global.hpp] MUST BE THE FIRST INCLUDE IN ALL SOURCE AND
// HEADER FILES !!!
//
// This header defines _GLIBCXX_DEBUG and _GLIBCXX_DEBUG_PEDANTIC for
// DEBUG builds.  If some standard headers are included before and
// after those symbols are defined, then that results in different
// container internal structure layouts and that is Not Good.
#include "global.hpp"  // IWYU pragma: keep

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string_view>
#include <thread>

#ifdef SPLITIDX_DETAIL_BOOST_STACKTRACE
#if !defined(BOOST_STACKTRACE_LINK)
#if defined(__linux__) && !defined(__clang__)
#define BOOST_STACKTRACE_USE_BACKTRACE
#elif defined(__APPLE__)
#define BOOST_STACKTRACE_GNU_SOURCE_NOT_REQUIRED
#endif
#endif
#include <boost/stacktrace.hpp>
#endif

namespace splitidx::detail {

// LCOV_EXCL_START

/// Print a message and a stacktrace to std::cerr, then abort.
[[noreturn, gnu::cold]] SPLITIDX_DETAIL_HEADER_NOINLINE void
msg_stacktrace_abort(std::string_view msg) noexcept {
  std::ostringstream buf;
  buf << msg;
#ifdef SPLITIDX_DETAIL_BOOST_STACKTRACE
  buf << boost::stacktrace::stacktrace();
#else
  buf << "(stacktrace not available, not compiled with Boost.Stacktrace)\n";
#endif
  std::cerr << buf.str();
  std::abort();
}

/// Intentionally crash from a given source location.
[[noreturn, gnu::cold]] SPLITIDX_DETAIL_C_STRING_ARG(1)
    SPLITIDX_DETAIL_C_STRING_ARG(3) SPLITIDX_DETAIL_HEADER_NOINLINE
    void crash(const char *file, int line, const char *func) noexcept {
  std::ostringstream buf;
  buf << "Crash requested at " << file << ':' << line << ", function \"" << func
      << "\", thread " << std::this_thread::get_id() << '\n';
  msg_stacktrace_abort(buf.str());
}

// Definitions that only depend on Debug vs Release
#ifndef NDEBUG

/// Implementation for marking a source code location as unreachable.
[[noreturn]] SPLITIDX_DETAIL_C_STRING_ARG(1)
    SPLITIDX_DETAIL_C_STRING_ARG(3) inline void cannot_happen(
        const char *file, int line, const char *func) noexcept {
  std::ostringstream buf;
  buf << "Execution reached an unreachable point at " << file << ':' << line
      << ": function \"" << func << "\", thread " << std::this_thread::get_id()
      << '\n';
  msg_stacktrace_abort(buf.str());
}

#else  // !NDEBUG

[[noreturn]] SPLITIDX_DETAIL_C_STRING_ARG(1) SPLITIDX_DETAIL_C_STRING_ARG(
    3) inline void cannot_happen(const char *, int, const char *) noexcept {
  SPLITIDX_DETAIL_UNREACHABLE();
}

#endif  // !NDEBUG

// Definitions that only depend on standalone vs part of another project
#ifdef SPLITIDX_DETAIL_STANDALONE

/// Intentionally crash.
#define SPLITIDX_DETAIL_CRASH()                         \
  splitidx::detail::crash(__FILE__, __LINE__, __func__)

#else  // SPLITIDX_DETAIL_STANDALONE

#define SPLITIDX_DETAIL_CRASH() std::abort()

#endif  // SPLITIDX_DETAIL_STANDALONE

// Definitions that depend on both Debug vs Release and standalone vs part of
// another project
#ifndef SPLITIDX_DETAIL_STANDALONE

#define SPLITIDX_DETAIL_ASSERT(condition) assert(condition)

#elif !defined(NDEBUG)

/// Assert failure implementation for standalone debug build.
[[noreturn, gnu::cold]] SPLITIDX_DETAIL_C_STRING_ARG(1)
    SPLITIDX_DETAIL_C_STRING_ARG(3)
        SPLITIDX_DETAIL_C_STRING_ARG(4) SPLITIDX_DETAIL_HEADER_NOINLINE
    void assert_failure(const char *file, int line, const char *func,
                        const char *condition) noexcept {
  std::ostringstream buf;
  buf << "Assertion \"" << condition << "\" failed at " << file << ':' << line
      << ", function \"" << func << "\", thread " << std::this_thread::get_id()
      << '\n';
  msg_stacktrace_abort(buf.str());
}

/// Assert a condition.
///
/// Should be used everywhere instead of the standard assert macro and will
/// expand to it if building as a part of another project. If building
/// standalone, will print a stacktrace on failures if Boost.Stacktrace is
/// available.
#define SPLITIDX_DETAIL_ASSERT(condition)                          \
  SPLITIDX_DETAIL_UNLIKELY(!(condition))                           \
  ? splitidx::detail::assert_failure(__FILE__, __LINE__, __func__, \
                                     #condition)                   \
  : ((void)0)

#else  // !defined(NDEBUG)

#define SPLITIDX_DETAIL_ASSERT(condition) ((void)0)

#endif  // !defined(NDEBUG)

}  // namespace splitidx::detail

/// Mark this source code location as unreachable.
///
/// Under release build the location is annotated for the compiler as
/// unreachable. Under debug build, if execution comes here, it will crash with
/// a stacktrace.
#define SPLITIDX_DETAIL_CANNOT_HAPPEN()                         \
  splitidx::detail::cannot_happen(__FILE__, __LINE__, __func__)

// LCOV_EXCL_STOP

#endif  // SPLITIDX_DETAIL_ASSERT_HPP
