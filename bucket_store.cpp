// Copyright 2025-2026 SplitIdx contributors

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

#include "bucket_store.hpp"

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <ios>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <gsl/util>

#include "blob_codec.hpp"
#include "bucket.hpp"

namespace {

constexpr splitidx::detail::blob_magic metadata_magic{'S', 'X', 'M', 'D'};

[[noreturn]] void throw_io_error(int err, const std::string &what,
                                 const std::filesystem::path &path) {
  throw std::system_error{err != 0 ? err : EIO, std::generic_category(),
                          what + " " + path.string()};
}

void write_file(const std::filesystem::path &path, splitidx::blob_view data) {
  std::ofstream out{path, std::ios::binary | std::ios::trunc};
  if (!out) throw_io_error(errno, "cannot open for writing", path);
  out.write(reinterpret_cast<const char *>(data.data()),
            gsl::narrow_cast<std::streamsize>(data.size()));
  out.flush();
  if (!out) throw_io_error(errno, "cannot write", path);
}

[[nodiscard]] std::optional<splitidx::blob> read_file(
    const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (ec) throw std::system_error{ec, "cannot stat " + path.string()};
    return {};
  }
  std::ifstream in{path, std::ios::binary};
  if (!in) throw_io_error(errno, "cannot open for reading", path);
  const std::string bytes{std::istreambuf_iterator<char>{in},
                          std::istreambuf_iterator<char>{}};
  if (in.bad()) throw_io_error(errno, "cannot read", path);
  splitidx::blob result(bytes.size());
  std::transform(bytes.cbegin(), bytes.cend(), result.begin(),
                 [](char c) { return static_cast<std::byte>(c); });
  return result;
}

}  // namespace

namespace splitidx {

void memory_bucket_store::save_bucket(bucket_id id, blob_view data) {
  buckets.insert_or_assign(id, blob{data.begin(), data.end()});
  ++save_count;
}

std::optional<blob> memory_bucket_store::load_bucket(bucket_id id) const {
  const auto pos = buckets.find(id);
  if (pos == buckets.cend()) return {};
  return pos->second;
}

void memory_bucket_store::save_metadata(blob_view data) {
  metadata.emplace(data.begin(), data.end());
  ++save_count;
}

std::optional<blob> memory_bucket_store::load_metadata() const {
  return metadata;
}

file_bucket_store::file_bucket_store(std::filesystem::path dir_)
    : dir{std::move(dir_)} {
  std::filesystem::create_directories(dir);
}

std::filesystem::path file_bucket_store::bucket_path(bucket_id id) const {
  return dir / ("bucket_" + std::to_string(id) + ".bin");
}

std::filesystem::path file_bucket_store::metadata_path() const {
  return dir / "hash_metadata.bin";
}

void file_bucket_store::save_bucket(bucket_id id, blob_view data) {
  write_file(bucket_path(id), data);
}

std::optional<blob> file_bucket_store::load_bucket(bucket_id id) const {
  return read_file(bucket_path(id));
}

void file_bucket_store::save_metadata(blob_view data) {
  write_file(metadata_path(), data);
}

std::optional<blob> file_bucket_store::load_metadata() const {
  return read_file(metadata_path());
}

blob table_metadata::encode() const {
  detail::blob_writer writer;
  writer.put(metadata_magic)
      .put(detail::blob_format_version)
      .put(global_depth)
      .put(next_bucket_id)
      .put(bucket_capacity)
      .put(static_cast<std::uint64_t>(directory.size()));
  for (const auto id : directory) writer.put(id);
  return writer.release();
}

std::optional<table_metadata> table_metadata::decode(blob_view data) {
  detail::blob_reader reader{data};
  std::uint32_t version{};
  table_metadata result;
  std::uint64_t directory_size{};
  if (!reader.expect(metadata_magic) || !reader.get(version) ||
      version != detail::blob_format_version ||
      !reader.get(result.global_depth) || !reader.get(result.next_bucket_id) ||
      !reader.get(result.bucket_capacity) || !reader.get(directory_size))
    return {};
  // Each slot takes sizeof(bucket_id) bytes, reject sizes the blob cannot hold
  if (directory_size > data.size() / sizeof(bucket_id)) return {};

  result.directory.resize(gsl::narrow_cast<std::size_t>(directory_size));
  for (auto &id : result.directory) {
    if (!reader.get(id)) return {};
  }
  if (!reader.at_end()) return {};
  return result;
}

}  // namespace splitidx
