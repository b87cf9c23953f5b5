// Copyright 2025-2026 SplitIdx contributors
#ifndef SPLITIDX_DETAIL_NODE_TYPE_HPP
#define SPLITIDX_DETAIL_NODE_TYPE_HPP

/// \file
/// B+ tree node types.
/// Defines the node types and, if compiling with stats, counter arrays indexed
/// by the types.

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

#include <cstddef>
#include <cstdint>
#include <iosfwd>

#ifdef SPLITIDX_DETAIL_WITH_STATS

#include <array>

#endif

namespace splitidx {

/// Node type in the B+ tree.
enum class [[nodiscard]] node_type : std::uint8_t {
  LEAF,     ///< Leaf node holding keys, values and the next leaf link
  INTERNAL  ///< Internal node holding separator keys and child handles
};

namespace detail {

/// The number of different node types.
constexpr std::size_t node_type_count{2};

}  // namespace detail

/// Print the short tag of a node type: `L` for a leaf, `I` for an internal
/// node.
std::ostream &operator<<(std::ostream &os, node_type type);

// The rest are used only if stats are compiled in
#ifdef SPLITIDX_DETAIL_WITH_STATS

/// An `std::array` of `std::uint64_t` values for each node type.
/// Use as_i() for indexing.
using node_type_counter_array =
    std::array<std::uint64_t, detail::node_type_count>;

/// Convert \a NodeType to a value suitable for use as an index.
/// Meant for using together with node_type_counter_array.
template <node_type NodeType>
inline constexpr auto as_i{static_cast<std::size_t>(NodeType)};

#endif  // SPLITIDX_DETAIL_WITH_STATS

}  // namespace splitidx

#endif  // SPLITIDX_DETAIL_NODE_TYPE_HPP
