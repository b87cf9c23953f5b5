// Copyright 2025-2026 SplitIdx contributors
#ifndef SPLITIDX_DETAIL_BUCKET_STORE_HPP
#define SPLITIDX_DETAIL_BUCKET_STORE_HPP

/// \file
/// Persistence of extendible hash table buckets and metadata.
///
/// A store maps bucket identities to blobs and keeps one more blob with the
/// table metadata. It knows nothing of the blob contents. I/O failures are
/// reported by throwing `std::system_error`.

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <vector>

#include "blob_codec.hpp"
#include "bucket.hpp"

namespace splitidx {

/// Abstract key to blob store for bucket and table metadata blobs.
class bucket_store {
 public:
  virtual ~bucket_store() = default;

  /// Replace the blob of bucket \a id.
  /// \throws std::system_error on I/O failure
  virtual void save_bucket(bucket_id id, blob_view data) = 0;

  /// \return the blob of bucket \a id, or an empty optional if there is none
  /// \throws std::system_error on I/O failure
  [[nodiscard]] virtual std::optional<blob> load_bucket(bucket_id id) const = 0;

  /// Replace the metadata blob.
  /// \throws std::system_error on I/O failure
  virtual void save_metadata(blob_view data) = 0;

  /// \return the metadata blob, or an empty optional if there is none
  /// \throws std::system_error on I/O failure
  [[nodiscard]] virtual std::optional<blob> load_metadata() const = 0;

  bucket_store(const bucket_store &) = delete;
  bucket_store(bucket_store &&) = delete;
  bucket_store &operator=(const bucket_store &) = delete;
  bucket_store &operator=(bucket_store &&) = delete;

 protected:
  bucket_store() noexcept = default;
};

/// A store keeping blobs in memory.
class memory_bucket_store final : public bucket_store {
 public:
  memory_bucket_store() noexcept = default;

  void save_bucket(bucket_id id, blob_view data) override;

  [[nodiscard]] std::optional<blob> load_bucket(bucket_id id) const override;

  void save_metadata(blob_view data) override;

  [[nodiscard]] std::optional<blob> load_metadata() const override;

  [[nodiscard]] std::size_t bucket_blob_count() const noexcept {
    return buckets.size();
  }

  /// Return the number of save_bucket() and save_metadata() calls.
  [[nodiscard]] std::uint64_t get_save_count() const noexcept {
    return save_count;
  }

 private:
  std::map<bucket_id, blob> buckets;
  std::optional<blob> metadata;
  std::uint64_t save_count{0};
};

/// A store keeping every blob in its own file under a directory:
/// `bucket_<id>.bin` for buckets and `hash_metadata.bin` for the metadata.
///
/// Files are rewritten in place, there is no crash consistency.
class file_bucket_store final : public bucket_store {
 public:
  /// Use \a dir_, creating it if needed.
  /// \throws std::filesystem::filesystem_error if \a dir_ cannot be created
  explicit file_bucket_store(std::filesystem::path dir_);

  void save_bucket(bucket_id id, blob_view data) override;

  [[nodiscard]] std::optional<blob> load_bucket(bucket_id id) const override;

  void save_metadata(blob_view data) override;

  [[nodiscard]] std::optional<blob> load_metadata() const override;

  [[nodiscard]] const std::filesystem::path &get_directory() const noexcept {
    return dir;
  }

  [[nodiscard]] std::filesystem::path bucket_path(bucket_id id) const;

  [[nodiscard]] std::filesystem::path metadata_path() const;

 private:
  std::filesystem::path dir;
};

/// Table-level state persisted beside the buckets.
struct [[nodiscard]] table_metadata final {
  depth_type global_depth{0};
  bucket_id next_bucket_id{0};
  std::uint64_t bucket_capacity{0};
  /// Bucket identity of every directory slot.
  std::vector<bucket_id> directory;

  [[nodiscard]] blob encode() const;

  /// \return the metadata, or an empty optional if \a data is not a complete
  /// metadata blob of the current format version
  [[nodiscard]] static std::optional<table_metadata> decode(blob_view data);
};

}  // namespace splitidx

#endif  // SPLITIDX_DETAIL_BUCKET_STORE_HPP
