// Copyright 2025-2026 SplitIdx contributors
#ifndef SPLITIDX_DETAIL_GLOBAL_HPP
#define SPLITIDX_DETAIL_GLOBAL_HPP

/// \file global.hpp
/// Global defines that must precede every other include directive in all the
/// source files.

// Macros that have multiple definitions are documented once.

/// \def SPLITIDX_DETAIL_C_STRING_ARG(x)
/// Mark a parameter as a null-terminated C string.
/// \param x The 1-based parameter index to be marked

/// \def SPLITIDX_DETAIL_UNLIKELY(condition)
/// \hideinitializer
/// Hint the compiler that the \a condition is likely false.

/// \def SPLITIDX_DETAIL_UNUSED
/// \hideinitializer
/// Mark a declaration as intentionally unused to suppress compiler warnings

/// \def SPLITIDX_DETAIL_NOINLINE
/// \hideinitializer
/// Ask the compiler to not inline the function

/// \def SPLITIDX_DETAIL_UNREACHABLE
/// \hideinitializer
/// Low-level macro to indicate an unreachable code.
/// Should not be used directly: use #SPLITIDX_DETAIL_CANNOT_HAPPEN in
/// assert.hpp instead.

/// \def SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(x)
/// Disable an MSVC warning \a x until SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()

/// \def SPLITIDX_DETAIL_DISABLE_CLANG_WARNING(x)
/// Disable a clang warning \a x until SPLITIDX_DETAIL_RESTORE_CLANG_WARNINGS()

/// \name CMake macros
/// Macros set by CMake.
///@{
// This section is never compiled in, only processed by Doxygen
#ifdef SPLITIDX_DETAIL_DOXYGEN

/// Defined when SplitIdx is built as a standalone project rather than as a
/// part of another project.
#define SPLITIDX_DETAIL_STANDALONE

/// Defined when SplitIdx is compiled with the statistics counters.
#define SPLITIDX_DETAIL_WITH_STATS

/// Defined when SplitIdx is compiled with Boost.Stacktrace.
#define SPLITIDX_DETAIL_BOOST_STACKTRACE

#endif  // SPLITIDX_DETAIL_DOXYGEN

///@}

#ifdef SPLITIDX_DETAIL_STANDALONE

/// \name libstdc++ debug mode
/// Defines to enable libstdc++ debug mode.
/// Only defined in the standalone debug configuration with GCC.
///@{
#if !defined(NDEBUG) && !defined(__clang__)

#ifndef _GLIBCXX_DEBUG
/// Enables the libstdc++ debug mode.
#define _GLIBCXX_DEBUG
#endif

#ifndef _GLIBCXX_DEBUG_PEDANTIC
/// Enables erroring on the use of libstdc++-specific behaviors and extensions.
#define _GLIBCXX_DEBUG_PEDANTIC
#endif

#endif  // !defined(NDEBUG) && !defined(__clang__)

///@}

#endif  // SPLITIDX_DETAIL_STANDALONE

#ifdef _MSC_VER
/// Defined under MSVC to stop redefining `min` and `max` if windows.h is
/// included later.
#define NOMINMAX
#endif

/// \name Compiler
/// Macros to hide compiler specifics
///@{

#if defined(_MSC_VER) && !defined(__clang__)
/// Defined on MSVC with the MSVC frontend, not the LLVM one
#define SPLITIDX_DETAIL_MSVC
#endif

#ifndef SPLITIDX_DETAIL_MSVC

#if !defined(__clang__) && __GNUG__ >= 14

#define SPLITIDX_DETAIL_C_STRING_ARG(x) \
  __attribute__((null_terminated_string_arg(x)))

#else

#define SPLITIDX_DETAIL_C_STRING_ARG(x)

#endif

#define SPLITIDX_DETAIL_UNLIKELY(condition) __builtin_expect(condition, 0)

#define SPLITIDX_DETAIL_UNUSED [[gnu::unused]]
#define SPLITIDX_DETAIL_NOINLINE __attribute__((noinline))
#define SPLITIDX_DETAIL_UNREACHABLE() __builtin_unreachable()

#else  // #ifndef SPLITIDX_DETAIL_MSVC

#define SPLITIDX_DETAIL_UNLIKELY(condition) (!!(condition))

#define SPLITIDX_DETAIL_UNUSED [[maybe_unused]]
#define SPLITIDX_DETAIL_NOINLINE __declspec(noinline)
#define SPLITIDX_DETAIL_UNREACHABLE() __assume(0)
#define SPLITIDX_DETAIL_C_STRING_ARG(x)

#endif  // #ifndef SPLITIDX_DETAIL_MSVC

///@}

/// A declaration specifier for a function in a header file that should not be
/// inlined.
/// \hideinitializer
/// This is a pair of two seemingly conflicting intentions: "noinline" and
/// "inline". However, only the "noinline" has anything to do with inlining. The
/// "inline" has nothing to do with inlining and is required for functions
/// declared in headers.
#define SPLITIDX_DETAIL_HEADER_NOINLINE SPLITIDX_DETAIL_NOINLINE inline

#define SPLITIDX_DETAIL_DO_PRAGMA(x) _Pragma(#x)

/// \name Warnings
///@{

#ifndef SPLITIDX_DETAIL_MSVC

#define SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(x)
#define SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()

#else  // #ifndef SPLITIDX_DETAIL_MSVC

#define SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(x) \
  _Pragma("warning(push)") SPLITIDX_DETAIL_DO_PRAGMA(warning(disable : x))

#define SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS() _Pragma("warning(pop)")

#endif  // #ifndef SPLITIDX_DETAIL_MSVC

#ifdef __clang__
#define SPLITIDX_DETAIL_DISABLE_CLANG_WARNING(x) \
  _Pragma("clang diagnostic push")               \
      SPLITIDX_DETAIL_DO_PRAGMA(clang diagnostic ignored x)
#define SPLITIDX_DETAIL_RESTORE_CLANG_WARNINGS() \
  _Pragma("clang diagnostic pop")
#else
#define SPLITIDX_DETAIL_DISABLE_CLANG_WARNING(x)
#define SPLITIDX_DETAIL_RESTORE_CLANG_WARNINGS()
#endif

///@}

#endif  // SPLITIDX_DETAIL_GLOBAL_HPP
