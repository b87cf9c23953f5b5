// Copyright 2025-2026 SplitIdx contributors
#ifndef SPLITIDX_DETAIL_EXT_HASH_HPP
#define SPLITIDX_DETAIL_EXT_HASH_HPP

/// \file
/// An extendible hash table with optional per-bucket persistence.

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <gsl/util>

#include "assert.hpp"
#include "bucket.hpp"
#include "bucket_store.hpp"
#include "fixed_hash.hpp"

namespace splitidx {

/// A non-thread-safe extendible hash table mapping unique keys to values.
///
/// The directory holds `2^global_depth()` bucket identities, the buckets live
/// in a pool indexed by identity. A bucket of local depth `d` is referenced by
/// all the `2^(global_depth() - d)` slots sharing its low `d` index bits.
///
/// If a store is given, every modified bucket and every metadata change is
/// written to it right away. Store failures are logged to `std::cerr` and
/// otherwise ignored: the in-memory table stays authoritative.
template <typename Key = std::int64_t, typename Value = std::int64_t,
          class Hash = fixed_hash<Key>>
class ext_hash final {
 public:
  /// The type of the keys in the index.
  using key_type = Key;
  /// The type of the value associated with the keys in the index.
  using value_type = Value;
  using hash_type = Hash;
  using get_result = std::optional<Value>;
  using bucket_type = bucket<Key, Value>;

  /// How many times an insert splits its target bucket before giving up.
  static constexpr unsigned max_insert_attempts{10};
  /// The largest global depth the directory may ever grow to.
  static constexpr depth_type max_global_depth{32};

  /// Create a table of `2^global_depth_` slots, each referencing its own
  /// empty bucket of local depth \a global_depth_.
  ///
  /// \param store_ Where to persist buckets and metadata, or nullptr. Not
  /// owned, must outlive the table.
  /// \param depth_limit_ The global depth past which the directory does not
  /// grow, at most max_global_depth.
  /// \throws std::invalid_argument if \a bucket_capacity_ is zero,
  /// \a depth_limit_ is outside `[1, max_global_depth]` or \a global_depth_
  /// is outside `[1, depth_limit_]`.
  explicit ext_hash(std::size_t bucket_capacity_ = 2,
                    depth_type global_depth_ = 1,
                    bucket_store *store_ = nullptr, Hash hash_ = {},
                    depth_type depth_limit_ = max_global_depth)
      : capacity{bucket_capacity_},
        depth{global_depth_},
        depth_limit{depth_limit_},
        store{store_},
        hasher{std::move(hash_)} {
    if (bucket_capacity_ == 0)
      throw std::invalid_argument("Bucket capacity must be positive");
    if (depth_limit_ == 0 || depth_limit_ > max_global_depth) {
      throw std::invalid_argument(
          "Global depth limit must be between 1 and " +
          std::to_string(max_global_depth) + ", got " +
          std::to_string(depth_limit_));
    }
    if (global_depth_ == 0 || global_depth_ > depth_limit_) {
      throw std::invalid_argument(
          "Global depth must be between 1 and " +
          std::to_string(depth_limit_) + ", got " +
          std::to_string(global_depth_));
    }

    const auto slots = std::size_t{1} << global_depth_;
    directory.reserve(slots);
    buckets.reserve(slots);
    for (std::size_t i = 0; i < slots; ++i) {
      directory.push_back(new_bucket(global_depth_));
      persist_bucket(directory.back());
    }
    persist_metadata();
  }

  ~ext_hash() noexcept = default;

  ext_hash(const ext_hash &) = delete;
  ext_hash(ext_hash &&) = delete;
  ext_hash &operator=(const ext_hash &) = delete;
  ext_hash &operator=(ext_hash &&) = delete;

  /// Rebuild a table from the metadata and buckets found in \a store_, which
  /// keeps receiving the changes of the returned table.
  ///
  /// \return the table, or nullptr if the store holds no complete and
  /// consistent table. The reason is logged to `std::cerr`.
  [[nodiscard]] static std::unique_ptr<ext_hash> open(bucket_store &store_,
                                                      Hash hash_ = {});

  /// Query for a value associated with a key.
  [[nodiscard]] get_result get(const Key &search_key) const {
    return buckets[directory[directory_index(search_key)]].get(search_key);
  }

  /// Insert a value under a key iff there is no entry for that key.
  ///
  /// \return true iff the key value pair was inserted. False on a duplicate
  /// key, and also if the target bucket is still full after
  /// max_insert_attempts splits or cannot be split at all.
  [[nodiscard]] bool insert(Key insert_key, Value v);

  /// Split the bucket referenced by directory slot \a index, doubling the
  /// directory first if the bucket's local depth equals the global depth.
  ///
  /// \return false if the directory would have to grow past
  /// global_depth_limit().
  [[nodiscard]] bool split_bucket(std::size_t index);

  /// Double the directory, the new upper half mirroring the lower half.
  ///
  /// \return false if the global depth is already global_depth_limit().
  [[nodiscard]] bool grow_directory();

  /// Return the directory slot for \a k: its low global_depth() hash bits.
  [[nodiscard]] std::size_t directory_index(const Key &k) const noexcept {
    const auto mask = (std::uint64_t{1} << depth) - 1;
    return gsl::narrow_cast<std::size_t>(hasher(k) & mask);
  }

  /// Return true iff the index holds no entries.
  [[nodiscard]] bool empty() const noexcept { return entries == 0; }

  /// Return the number of entries in the index.
  [[nodiscard]] std::size_t size() const noexcept { return entries; }

  [[nodiscard]] depth_type global_depth() const noexcept { return depth; }

  [[nodiscard]] depth_type global_depth_limit() const noexcept {
    return depth_limit;
  }

  [[nodiscard]] std::size_t directory_size() const noexcept {
    return directory.size();
  }

  [[nodiscard]] std::size_t bucket_count() const noexcept {
    return buckets.size();
  }

  [[nodiscard]] std::size_t bucket_capacity() const noexcept {
    return capacity;
  }

  /// Return the identity the next created bucket will get.
  [[nodiscard]] bucket_id next_bucket_id() const noexcept {
    return gsl::narrow_cast<bucket_id>(buckets.size());
  }

  [[nodiscard]] bucket_id bucket_id_at(std::size_t slot) const noexcept {
    SPLITIDX_DETAIL_ASSERT(slot < directory.size());
    return directory[slot];
  }

  [[nodiscard]] const bucket_type &bucket_at(std::size_t slot) const noexcept {
    return buckets[bucket_id_at(slot)];
  }

  [[nodiscard]] const bucket_type &get_bucket(bucket_id id) const noexcept {
    SPLITIDX_DETAIL_ASSERT(id < buckets.size());
    return buckets[id];
  }

  [[nodiscard]] const bucket_store *get_store() const noexcept { return store; }

  // Stats

#ifdef SPLITIDX_DETAIL_WITH_STATS

  [[nodiscard]] constexpr auto get_bucket_splits() const noexcept {
    return bucket_splits;
  }

  [[nodiscard]] constexpr auto get_directory_doublings() const noexcept {
    return directory_doublings;
  }

  [[nodiscard]] constexpr auto get_persistence_failures() const noexcept {
    return persistence_failures;
  }

#endif  // SPLITIDX_DETAIL_WITH_STATS

  // Public utils
  [[nodiscard, gnu::const]] static constexpr auto key_found(
      const get_result &result) noexcept {
    return result.has_value();
  }

  // Debugging
  [[gnu::cold]] SPLITIDX_DETAIL_NOINLINE void dump(std::ostream &os) const;
  [[gnu::cold]] SPLITIDX_DETAIL_NOINLINE void dump() const;

 private:
  ext_hash(table_metadata &&metadata, std::vector<bucket_type> &&buckets_,
           std::size_t entries_, bucket_store &store_, Hash hash_)
      : directory{std::move(metadata.directory)},
        buckets{std::move(buckets_)},
        capacity{gsl::narrow_cast<std::size_t>(metadata.bucket_capacity)},
        depth{metadata.global_depth},
        depth_limit{max_global_depth},
        entries{entries_},
        store{&store_},
        hasher{std::move(hash_)} {}

  [[nodiscard]] bucket_id new_bucket(depth_type local_depth) {
    const auto result = next_bucket_id();
    buckets.emplace_back(result, capacity, local_depth);
    return result;
  }

  void persist_bucket(bucket_id id);

  void persist_metadata();

  [[gnu::cold]] void persistence_failed(const std::string &what,
                                        const std::system_error &e);

  /// Return an empty string if \a metadata and \a buckets_ form a valid table
  /// under \a hash_, otherwise a description of the first problem found.
  [[nodiscard]] static std::string validate(
      const table_metadata &metadata, const std::vector<bucket_type> &buckets_,
      const Hash &hash_);

  std::vector<bucket_id> directory;

  std::vector<bucket_type> buckets;

  const std::size_t capacity;

  depth_type depth;

  const depth_type depth_limit;

  std::size_t entries{0};

  bucket_store *const store;

  [[no_unique_address]] Hash hasher;

#ifdef SPLITIDX_DETAIL_WITH_STATS

  std::uint64_t bucket_splits{0};
  std::uint64_t directory_doublings{0};
  std::uint64_t persistence_failures{0};

#endif  // SPLITIDX_DETAIL_WITH_STATS
};

template <typename Key, typename Value, class Hash>
bool ext_hash<Key, Value, Hash>::insert(Key insert_key, Value v) {
  for (unsigned attempt = 0; attempt < max_insert_attempts; ++attempt) {
    const auto index = directory_index(insert_key);
    const auto id = directory[index];
    auto &target = buckets[id];
    if (target.contains(insert_key)) return false;

    if (target.insert(insert_key, v)) {
      ++entries;
      persist_bucket(id);
      return true;
    }

    if (!split_bucket(index)) return false;
  }
  return false;
}

template <typename Key, typename Value, class Hash>
bool ext_hash<Key, Value, Hash>::split_bucket(std::size_t index) {
  SPLITIDX_DETAIL_ASSERT(index < directory.size());
  const auto old_id = directory[index];

  if (buckets[old_id].local_depth() == depth) {
    if (!grow_directory()) return false;
  }
  SPLITIDX_DETAIL_ASSERT(buckets[old_id].local_depth() < depth);

  const auto local_depth = buckets[old_id].local_depth() + 1;
  buckets[old_id].set_local_depth(local_depth);
  // May reallocate the bucket pool, no bucket references are held across it
  const auto sibling_id = new_bucket(local_depth);

  const auto high_bit = std::size_t{1} << (local_depth - 1);
  for (std::size_t i = 0; i < directory.size(); ++i) {
    if (directory[i] == old_id && (i & high_bit) != 0)
      directory[i] = sibling_id;
  }

  auto items = buckets[old_id].take_items();
  for (auto &[k, v] : items) {
    const auto target = directory[directory_index(k)];
    SPLITIDX_DETAIL_ASSERT(target == old_id || target == sibling_id);
    buckets[target].put(k, std::move(v));
  }

#ifdef SPLITIDX_DETAIL_WITH_STATS
  ++bucket_splits;
#endif  // SPLITIDX_DETAIL_WITH_STATS

  persist_bucket(old_id);
  persist_bucket(sibling_id);
  persist_metadata();
  return true;
}

template <typename Key, typename Value, class Hash>
bool ext_hash<Key, Value, Hash>::grow_directory() {
  if (depth >= depth_limit) return false;

  const auto old_size = directory.size();
  directory.reserve(old_size * 2);
  for (std::size_t i = 0; i < old_size; ++i)
    directory.push_back(directory[i]);
  ++depth;

#ifdef SPLITIDX_DETAIL_WITH_STATS
  ++directory_doublings;
#endif  // SPLITIDX_DETAIL_WITH_STATS

  persist_metadata();
  return true;
}

template <typename Key, typename Value, class Hash>
void ext_hash<Key, Value, Hash>::persist_bucket(bucket_id id) {
  if (store == nullptr) return;
  try {
    store->save_bucket(id, buckets[id].encode());
  } catch (const std::system_error &e) {
    persistence_failed("save bucket " + std::to_string(id), e);
  }
}

template <typename Key, typename Value, class Hash>
void ext_hash<Key, Value, Hash>::persist_metadata() {
  if (store == nullptr) return;
  try {
    const table_metadata metadata{depth, next_bucket_id(), capacity,
                                  directory};
    store->save_metadata(metadata.encode());
  } catch (const std::system_error &e) {
    persistence_failed("save hash table metadata", e);
  }
}

template <typename Key, typename Value, class Hash>
void ext_hash<Key, Value, Hash>::persistence_failed(
    const std::string &what, const std::system_error &e) {
#ifdef SPLITIDX_DETAIL_WITH_STATS
  ++persistence_failures;
#endif  // SPLITIDX_DETAIL_WITH_STATS
  std::cerr << "splitidx: warning: failed to " << what << ": " << e.what()
            << '\n';
}

template <typename Key, typename Value, class Hash>
std::string ext_hash<Key, Value, Hash>::validate(
    const table_metadata &metadata, const std::vector<bucket_type> &buckets_,
    const Hash &hash_) {
  const auto global_depth_ = metadata.global_depth;
  if (global_depth_ == 0 || global_depth_ > max_global_depth)
    return "global depth " + std::to_string(global_depth_) + " out of range";
  if (metadata.bucket_capacity == 0) return "zero bucket capacity";
  if (metadata.directory.size() != (std::size_t{1} << global_depth_)) {
    return "directory size " + std::to_string(metadata.directory.size()) +
           " does not match global depth " + std::to_string(global_depth_);
  }

  constexpr auto unseen = std::numeric_limits<std::size_t>::max();
  std::vector<std::size_t> slot_counts(buckets_.size());
  std::vector<std::size_t> first_slots(buckets_.size(), unseen);
  for (std::size_t i = 0; i < metadata.directory.size(); ++i) {
    const auto id = metadata.directory[i];
    if (id >= buckets_.size())
      return "slot " + std::to_string(i) + " references unknown bucket";
    const auto &b = buckets_[id];
    if (b.local_depth() > global_depth_) {
      return "bucket " + std::to_string(id) +
             " local depth exceeds global depth";
    }
    if (first_slots[id] == unseen) first_slots[id] = i;
    const auto low_bits_mask = (std::size_t{1} << b.local_depth()) - 1;
    if ((i & low_bits_mask) != (first_slots[id] & low_bits_mask)) {
      return "bucket " + std::to_string(id) +
             " referenced by slots differing in low bits";
    }
    ++slot_counts[id];
  }

  const auto mask = (std::uint64_t{1} << global_depth_) - 1;
  for (const auto &b : buckets_) {
    if (b.local_depth() > global_depth_) {
      return "bucket " + std::to_string(b.id()) +
             " local depth exceeds global depth";
    }
    const auto expected = std::size_t{1}
                          << (global_depth_ - b.local_depth());
    if (slot_counts[b.id()] != expected) {
      return "bucket " + std::to_string(b.id()) + " referenced by " +
             std::to_string(slot_counts[b.id()]) + " slots instead of " +
             std::to_string(expected);
    }
    for (const auto &item : b.items()) {
      const auto slot = gsl::narrow_cast<std::size_t>(hash_(item.first) & mask);
      if (metadata.directory[slot] != b.id()) {
        return "bucket " + std::to_string(b.id()) +
               " holds a key hashing to another bucket";
      }
    }
  }
  return {};
}

template <typename Key, typename Value, class Hash>
std::unique_ptr<ext_hash<Key, Value, Hash>> ext_hash<Key, Value, Hash>::open(
    bucket_store &store_, Hash hash_) {
  const auto fail = [](const std::string &reason) {
    std::cerr << "splitidx: warning: cannot open hash table: " << reason
              << '\n';
    return std::unique_ptr<ext_hash>{};
  };

  try {
    const auto metadata_blob = store_.load_metadata();
    if (!metadata_blob) return fail("no metadata");
    auto metadata = table_metadata::decode(*metadata_blob);
    if (!metadata) return fail("corrupt metadata");
    if (metadata->bucket_capacity == 0) return fail("zero bucket capacity");
    // Every bucket is referenced by at least one slot
    if (metadata->next_bucket_id > metadata->directory.size())
      return fail("more buckets than directory slots");
    const auto capacity_ =
        gsl::narrow_cast<std::size_t>(metadata->bucket_capacity);

    std::vector<bucket_type> buckets_;
    buckets_.reserve(metadata->next_bucket_id);
    std::size_t entries_{0};
    for (bucket_id id = 0; id < metadata->next_bucket_id; ++id) {
      const auto bucket_blob = store_.load_bucket(id);
      if (!bucket_blob)
        return fail("bucket " + std::to_string(id) + " missing");
      auto b = bucket_type::decode(id, capacity_, *bucket_blob);
      if (!b) return fail("bucket " + std::to_string(id) + " corrupt");
      entries_ += b->size();
      buckets_.push_back(std::move(*b));
    }

    const auto problem = validate(*metadata, buckets_, hash_);
    if (!problem.empty()) return fail(problem);

    // The restoring constructor is private, out of std::make_unique's reach
    return std::unique_ptr<ext_hash>{new ext_hash{std::move(*metadata),
                                                  std::move(buckets_), entries_,
                                                  store_, std::move(hash_)}};
  } catch (const std::system_error &e) {
    return fail(e.what());
  }
}

template <typename Key, typename Value, class Hash>
void ext_hash<Key, Value, Hash>::dump(std::ostream &os) const {
  os << "ext_hash dump, global depth = " << depth
     << ", directory size = " << directory.size()
     << ", buckets = " << buckets.size() << ", bucket capacity = " << capacity
     << ", entries = " << entries;
#ifdef SPLITIDX_DETAIL_WITH_STATS
  os << ", bucket splits = " << bucket_splits
     << ", directory doublings = " << directory_doublings;
#endif  // SPLITIDX_DETAIL_WITH_STATS
  os << '\n';
  for (std::size_t i = 0; i < directory.size(); ++i) {
    os << "  ";
    // The slot index in binary, depth digits wide
    for (auto bit = depth; bit > 0; --bit)
      os << (((i >> (bit - 1)) & 1U) != 0 ? '1' : '0');
    os << " -> ";
    buckets[directory[i]].dump(os);
  }
}

// LCOV_EXCL_START
template <typename Key, typename Value, class Hash>
void ext_hash<Key, Value, Hash>::dump() const {
  dump(std::cerr);
}
// LCOV_EXCL_STOP

}  // namespace splitidx

#endif  // SPLITIDX_DETAIL_EXT_HASH_HPP
