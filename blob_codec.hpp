// Copyright 2025-2026 SplitIdx contributors
#ifndef SPLITIDX_DETAIL_BLOB_CODEC_HPP
#define SPLITIDX_DETAIL_BLOB_CODEC_HPP

/// \file
/// Byte blobs and the field-by-field codec for the persisted hash table.
///
/// Fields are trivially copyable values stored in host byte order, back to
/// back, without padding.

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

namespace splitidx {

/// An owned byte blob, as stored by splitidx::bucket_store.
using blob = std::vector<std::byte>;

/// Non-owning view of blob bytes.
using blob_view = std::span<const std::byte>;

namespace detail {

/// Four bytes identifying the kind of a blob.
using blob_magic = std::array<char, 4>;

/// The version of the persisted format written by this code.
inline constexpr std::uint32_t blob_format_version{1};

/// Appends fields to a blob.
class [[nodiscard]] blob_writer final {
 public:
  template <typename T>
  blob_writer &put(const T &field) {
    static_assert(std::is_trivially_copyable_v<T>);
    const auto *const bytes = reinterpret_cast<const std::byte *>(&field);
    buf.insert(buf.end(), bytes, bytes + sizeof(T));
    return *this;
  }

  [[nodiscard]] blob release() noexcept { return std::move(buf); }

 private:
  blob buf;
};

/// Reads fields back from a blob. A read past the end fails instead of
/// touching memory outside the blob.
class [[nodiscard]] blob_reader final {
 public:
  explicit blob_reader(blob_view data_) noexcept : data{data_} {}

  template <typename T>
  [[nodiscard]] bool get(T &field) noexcept {
    static_assert(std::is_trivially_copyable_v<T>);
    if (data.size() - pos < sizeof(T)) return false;
    std::memcpy(&field, data.data() + pos, sizeof(T));
    pos += sizeof(T);
    return true;
  }

  /// Read a magic value and check it against \a expected.
  [[nodiscard]] bool expect(const blob_magic &expected) noexcept {
    blob_magic actual{};
    return get(actual) && actual == expected;
  }

  [[nodiscard]] bool at_end() const noexcept { return pos == data.size(); }

 private:
  blob_view data;
  std::size_t pos{0};
};

}  // namespace detail

}  // namespace splitidx

#endif  // SPLITIDX_DETAIL_BLOB_CODEC_HPP
