// Copyright 2025-2026 SplitIdx contributors
#ifndef SPLITIDX_DETAIL_BULK_LOAD_HPP
#define SPLITIDX_DETAIL_BULK_LOAD_HPP

/// \file
/// Loading newline-delimited integer keys into an index.
///
/// Works with any index type providing `key_type`, `value_type` and
/// `insert(key, value)` returning false on a duplicate key. Every key is
/// inserted with itself as the value.

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

#include <charconv>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace splitidx {

/// Line counts of one load.
struct [[nodiscard]] load_stats final {
  /// Keys inserted.
  std::size_t inserted{0};
  /// Well-formed keys already present in the index.
  std::size_t duplicates{0};
  /// Lines that were not a single integer of the key type, and were skipped.
  std::size_t malformed{0};
  /// Empty or whitespace-only lines, silently skipped.
  std::size_t blank{0};

  [[nodiscard]] constexpr bool operator==(const load_stats &) const noexcept =
      default;
};

std::ostream &operator<<(std::ostream &os, const load_stats &stats);

namespace detail {

/// Return \a line without leading and trailing whitespace.
[[nodiscard]] std::string_view trim(std::string_view line) noexcept;

/// Open \a path for reading.
/// \throws std::system_error if the file cannot be opened
[[nodiscard]] std::ifstream open_input(const std::filesystem::path &path);

/// Parse a whole trimmed line as a \a Key. A single leading `+` before a
/// digit is accepted.
template <typename Key>
[[nodiscard]] std::optional<Key> parse_key(std::string_view token) noexcept {
  if (token.size() > 1 && token[0] == '+' && token[1] >= '0' &&
      token[1] <= '9')
    token.remove_prefix(1);
  Key result{};
  const auto *const end = token.data() + token.size();
  const auto [ptr, ec] = std::from_chars(token.data(), end, result);
  if (ec != std::errc{} || ptr != end) return {};
  return result;
}

}  // namespace detail

/// Insert every key read from \a in into \a index. Malformed lines are
/// reported to `std::cerr` with their line number and skipped.
template <class Index>
load_stats load_keys(Index &index, std::istream &in) {
  using key_type = typename Index::key_type;
  using value_type = typename Index::value_type;

  load_stats result;
  std::string line;
  std::size_t line_number{0};
  while (std::getline(in, line)) {
    ++line_number;
    const auto token = detail::trim(line);
    if (token.empty()) {
      ++result.blank;
      continue;
    }
    const auto key = detail::parse_key<key_type>(token);
    if (!key) {
      ++result.malformed;
      std::cerr << "splitidx: skipping malformed line " << line_number << ": \""
                << token << "\"\n";
      continue;
    }
    if (index.insert(*key, static_cast<value_type>(*key)))
      ++result.inserted;
    else
      ++result.duplicates;
  }
  return result;
}

/// Insert every key read from the file at \a path into \a index.
/// \throws std::system_error if the file cannot be opened
template <class Index>
load_stats load_keys_from_file(Index &index,
                               const std::filesystem::path &path) {
  auto in = detail::open_input(path);
  return load_keys(index, in);
}

}  // namespace splitidx

#endif  // SPLITIDX_DETAIL_BULK_LOAD_HPP
