// Copyright 2025-2026 SplitIdx contributors
#ifndef SPLITIDX_DETAIL_BPTREE_INTERNAL_HPP
#define SPLITIDX_DETAIL_BPTREE_INTERNAL_HPP

/// \file
/// B+ tree node representation.
///
/// Nodes live in an arena owned by splitidx::bptree and refer to each other by
/// integer handles, so parent, child and next-leaf links never own anything.

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <limits>
#include <utility>
#include <variant>
#include <vector>

#include "assert.hpp"
#include "node_type.hpp"

namespace splitidx {

template <typename Key, typename Value>
class bptree;

namespace detail {

/// Handle of a node in the B+ tree node arena.
using node_id = std::uint32_t;

/// The handle value meaning "no node": the parent of the root, or the next leaf
/// of the rightmost leaf.
inline constexpr node_id null_node{std::numeric_limits<node_id>::max()};

/// Leaf-only part of a node: values parallel to the keys and the leaf chain.
template <typename Value>
struct [[nodiscard]] leaf_body final {
  std::vector<Value> values;
  node_id next{null_node};
};

/// Internal-only part of a node: child handles, one more than the keys.
struct [[nodiscard]] inode_body final {
  std::vector<node_id> children;
};

/// A B+ tree node, tagged as either a leaf or an internal node.
///
/// The public interface is read-only. All mutation happens in
/// splitidx::bptree, which is the only friend.
template <typename Key, typename Value>
class [[nodiscard]] bptree_node final {
 public:
  using key_type = Key;
  using value_type = Value;

  [[nodiscard]] static bptree_node make_leaf(node_id parent_) {
    return bptree_node{parent_, leaf_body<Value>{}};
  }

  [[nodiscard]] static bptree_node make_inode(node_id parent_) {
    return bptree_node{parent_, inode_body{}};
  }

  [[nodiscard]] bool is_leaf() const noexcept {
    return std::holds_alternative<leaf_body<Value>>(body);
  }

  [[nodiscard]] node_type type() const noexcept {
    return is_leaf() ? node_type::LEAF : node_type::INTERNAL;
  }

  [[nodiscard]] const std::vector<Key> &keys() const noexcept { return keys_; }

  [[nodiscard]] node_id parent() const noexcept { return parent_node; }

  /// \pre is_leaf()
  [[nodiscard]] const std::vector<Value> &values() const noexcept {
    return leaf().values;
  }

  /// \pre is_leaf()
  [[nodiscard]] node_id next_leaf() const noexcept { return leaf().next; }

  /// \pre !is_leaf()
  [[nodiscard]] const std::vector<node_id> &children() const noexcept {
    return inode().children;
  }

  // Debugging
  [[gnu::cold]] SPLITIDX_DETAIL_NOINLINE void dump(std::ostream &os) const {
    os << type() << '[';
    for (std::size_t i = 0; i < keys_.size(); ++i) {
      if (i > 0) os << ", ";
      os << keys_[i];
    }
    os << ']';
  }

 private:
  friend class splitidx::bptree<Key, Value>;

  bptree_node(node_id parent_, leaf_body<Value> body_)
      : parent_node{parent_}, body{std::move(body_)} {}

  bptree_node(node_id parent_, inode_body body_)
      : parent_node{parent_}, body{std::move(body_)} {}

  [[nodiscard]] leaf_body<Value> &leaf() noexcept {
    SPLITIDX_DETAIL_ASSERT(is_leaf());
    return *std::get_if<leaf_body<Value>>(&body);
  }

  [[nodiscard]] const leaf_body<Value> &leaf() const noexcept {
    SPLITIDX_DETAIL_ASSERT(is_leaf());
    return *std::get_if<leaf_body<Value>>(&body);
  }

  [[nodiscard]] inode_body &inode() noexcept {
    SPLITIDX_DETAIL_ASSERT(!is_leaf());
    return *std::get_if<inode_body>(&body);
  }

  [[nodiscard]] const inode_body &inode() const noexcept {
    SPLITIDX_DETAIL_ASSERT(!is_leaf());
    return *std::get_if<inode_body>(&body);
  }

  std::vector<Key> keys_;
  node_id parent_node;
  std::variant<leaf_body<Value>, inode_body> body;
};

}  // namespace detail

}  // namespace splitidx

#endif  // SPLITIDX_DETAIL_BPTREE_INTERNAL_HPP
