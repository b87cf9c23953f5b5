// Copyright 2025-2026 SplitIdx contributors
#ifndef SPLITIDX_DETAIL_BUCKET_HPP
#define SPLITIDX_DETAIL_BUCKET_HPP

/// \file
/// Extendible hash table bucket.

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <type_traits>
#include <utility>

#include "assert.hpp"
#include "blob_codec.hpp"

namespace splitidx {

/// Identity of a bucket. Dense, assigned in creation order, and the key of the
/// bucket's persisted blob.
using bucket_id = std::uint32_t;

/// Local or global depth: a number of low-order hash bits.
using depth_type = std::uint32_t;

template <typename Key, typename Value, class Hash>
class ext_hash;

namespace detail {

inline constexpr blob_magic bucket_magic{'S', 'X', 'B', 'K'};

}  // namespace detail

/// A fixed-capacity set of key value pairs whose keys share their low
/// local_depth() hash bits.
template <typename Key, typename Value>
class [[nodiscard]] bucket final {
 public:
  using key_type = Key;
  using value_type = Value;
  using items_type = std::map<Key, Value>;

  bucket(bucket_id id_, std::size_t capacity_, depth_type local_depth_)
      : identity{id_}, max_items{capacity_}, depth{local_depth_} {
    SPLITIDX_DETAIL_ASSERT(capacity_ > 0);
  }

  [[nodiscard]] bucket_id id() const noexcept { return identity; }

  [[nodiscard]] std::size_t capacity() const noexcept { return max_items; }

  [[nodiscard]] depth_type local_depth() const noexcept { return depth; }

  [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }

  [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

  [[nodiscard]] bool full() const noexcept {
    return items_.size() >= max_items;
  }

  [[nodiscard]] bool contains(const Key &k) const {
    return items_.find(k) != items_.cend();
  }

  [[nodiscard]] std::optional<Value> get(const Key &k) const {
    const auto pos = items_.find(k);
    if (pos == items_.cend()) return {};
    return pos->second;
  }

  [[nodiscard]] const items_type &items() const noexcept { return items_; }

  /// Insert iff the key is not present and the bucket is not full.
  [[nodiscard]] bool insert(const Key &k, const Value &v) {
    if (full()) return false;
    return items_.try_emplace(k, v).second;
  }

  /// Serialize the local depth and the items.
  [[nodiscard]] blob encode() const {
    static_assert(std::is_trivially_copyable_v<Key>);
    static_assert(std::is_trivially_copyable_v<Value>);

    detail::blob_writer writer;
    writer.put(detail::bucket_magic)
        .put(detail::blob_format_version)
        .put(depth)
        .put(static_cast<std::uint64_t>(items_.size()));
    for (const auto &[k, v] : items_) writer.put(k).put(v);
    return writer.release();
  }

  /// Deserialize a blob written by encode().
  ///
  /// \return the bucket, or an empty optional if the blob is truncated, has
  /// trailing bytes, a foreign magic or version, more items than \a capacity_,
  /// or repeated keys.
  [[nodiscard]] static std::optional<bucket> decode(bucket_id id_,
                                                    std::size_t capacity_,
                                                    blob_view data) {
    detail::blob_reader reader{data};
    std::uint32_t version{};
    depth_type local_depth_{};
    std::uint64_t count{};
    if (!reader.expect(detail::bucket_magic) || !reader.get(version) ||
        version != detail::blob_format_version || !reader.get(local_depth_) ||
        local_depth_ == 0 || !reader.get(count) || count > capacity_)
      return {};

    bucket result{id_, capacity_, local_depth_};
    for (std::uint64_t i = 0; i < count; ++i) {
      Key k{};
      Value v{};
      if (!reader.get(k) || !reader.get(v)) return {};
      if (!result.items_.try_emplace(k, v).second) return {};
    }
    if (!reader.at_end()) return {};
    return result;
  }

  // Debugging
  [[gnu::cold]] SPLITIDX_DETAIL_NOINLINE void dump(std::ostream &os) const {
    os << "Bucket-" << identity << " (local depth " << depth << "):";
    if (items_.empty()) {
      os << " empty\n";
      return;
    }
    for (const auto &[k, v] : items_) os << ' ' << k << " -> " << v;
    os << '\n';
  }

 private:
  template <typename, typename, class>
  friend class ext_hash;

  void set_local_depth(depth_type local_depth_) noexcept {
    depth = local_depth_;
  }

  /// Remove all items, returning them.
  [[nodiscard]] items_type take_items() {
    return std::exchange(items_, items_type{});
  }

  /// Insert during redistribution, where neither a duplicate nor an overflow
  /// is possible.
  void put(const Key &k, Value &&v) {
    SPLITIDX_DETAIL_ASSERT(!full());
    SPLITIDX_DETAIL_UNUSED const auto inserted =
        items_.try_emplace(k, std::move(v)).second;
    SPLITIDX_DETAIL_ASSERT(inserted);
  }

  bucket_id identity;
  std::size_t max_items;
  depth_type depth;
  items_type items_;
};

}  // namespace splitidx

#endif  // SPLITIDX_DETAIL_BUCKET_HPP
