// Copyright 2025-2026 SplitIdx contributors
#ifndef SPLITIDX_DETAIL_FIXED_HASH_HPP
#define SPLITIDX_DETAIL_FIXED_HASH_HPP

/// \file
/// Deterministic hash functions for the extendible hash table.
///
/// Bucket placement is derived from the low bits of the hash and is persisted,
/// so the hash of a key must be the same in every process and on every run.
/// `std::hash` gives no such guarantee and is not used.

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

#include <cstdint>
#include <type_traits>

namespace splitidx {

namespace detail {

/// The 64-bit finalizer of MurmurHash3 by Austin Appleby.
///
/// A bijection on 64-bit values in which every input bit affects every output
/// bit, so the low bits used for directory indexing are well mixed.
[[nodiscard, gnu::const]] constexpr std::uint64_t fmix64(
    std::uint64_t k) noexcept {
  k ^= k >> 33U;
  k *= 0xFF51AFD7ED558CCDULL;
  k ^= k >> 33U;
  k *= 0xC4CEB9FE1A85EC53ULL;
  k ^= k >> 33U;
  return k;
}

}  // namespace detail

/// Default hash of the extendible hash table: fmix64 over the two's complement
/// bits of an integral key.
template <typename Key>
struct fixed_hash final {
  static_assert(std::is_integral_v<Key>,
                "fixed_hash is only defined for integral keys");

  [[nodiscard, gnu::const]] constexpr std::uint64_t operator()(
      Key k) const noexcept {
    return detail::fmix64(static_cast<std::uint64_t>(k));
  }
};

/// Hash returning the key itself, `h(k) = k`. Makes bucket placement
/// predictable by hand.
struct identity_hash final {
  template <typename Key>
  [[nodiscard, gnu::const]] constexpr std::uint64_t operator()(
      Key k) const noexcept {
    static_assert(std::is_integral_v<Key>);
    return static_cast<std::uint64_t>(k);
  }
};

}  // namespace splitidx

#endif  // SPLITIDX_DETAIL_FIXED_HASH_HPP
