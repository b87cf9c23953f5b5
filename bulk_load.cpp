// Copyright 2025-2026 SplitIdx contributors

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

#include "bulk_load.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>

namespace splitidx {

std::ostream &operator<<(std::ostream &os, const load_stats &stats) {
  return os << "inserted = " << stats.inserted
            << ", duplicates = " << stats.duplicates
            << ", malformed = " << stats.malformed
            << ", blank = " << stats.blank;
}

namespace detail {

std::string_view trim(std::string_view line) noexcept {
  constexpr std::string_view whitespace{" \t\r\n\f\v"};
  const auto first = line.find_first_not_of(whitespace);
  if (first == std::string_view::npos) return {};
  const auto last = line.find_last_not_of(whitespace);
  return line.substr(first, last - first + 1);
}

std::ifstream open_input(const std::filesystem::path &path) {
  std::ifstream result{path};
  if (!result) {
    const auto err = errno != 0 ? errno : ENOENT;
    throw std::system_error{err, std::generic_category(),
                            "cannot open " + path.string()};
  }
  return result;
}

}  // namespace detail

}  // namespace splitidx
