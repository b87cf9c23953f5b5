// Copyright 2025-2026 SplitIdx contributors
#ifndef SPLITIDX_DETAIL_BPTREE_HPP
#define SPLITIDX_DETAIL_BPTREE_HPP

/// \file
/// An in-memory B+ tree with parent handles and a chained leaf level.

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <gsl/util>

#include "assert.hpp"
#include "bptree_internal.hpp"
#include "node_type.hpp"

namespace splitidx {

/// A non-thread-safe B+ tree mapping unique keys to values.
///
/// Nodes are stored in an arena and addressed by handles. A node splits as
/// soon as its key count reaches the order, so at rest every node holds at
/// most `order() - 1` keys. Leaf splits copy the first key of the new sibling
/// up, internal node splits push the middle key up. Splits cascade towards the
/// root iteratively.
///
/// Nodes are never freed: the index supports no deletion.
template <typename Key = std::int64_t, typename Value = std::int64_t>
class bptree final {
 public:
  /// The type of the keys in the index.
  using key_type = Key;
  /// The type of the value associated with the keys in the index.
  using value_type = Value;
  using get_result = std::optional<Value>;
  using node_id = detail::node_id;
  using node = detail::bptree_node<Key, Value>;

  /// The order used when none is given.
  static constexpr std::size_t default_order{4};
  /// The smallest order for which an internal node split leaves a key in both
  /// halves.
  static constexpr std::size_t min_order{3};

  /// Create an empty tree, consisting of a single empty root leaf.
  ///
  /// \param order_ The key count at which a node splits.
  /// \throws std::invalid_argument if \a order_ is less than min_order.
  explicit bptree(std::size_t order_ = default_order) : max_keys{order_} {
    if (order_ < min_order) {
      throw std::invalid_argument("B+ tree order must be at least " +
                                  std::to_string(min_order) + ", got " +
                                  std::to_string(order_));
    }
    root_node = new_node(node::make_leaf(detail::null_node));
  }

  ~bptree() noexcept = default;

  bptree(const bptree &) = delete;
  bptree(bptree &&) = delete;
  bptree &operator=(const bptree &) = delete;
  bptree &operator=(bptree &&) = delete;

  /// Query for a value associated with a key.
  [[nodiscard]] get_result get(Key search_key) const {
    const auto &leaf = nodes[find_leaf(search_key)];
    const auto &keys = leaf.keys();
    const auto pos = std::find(keys.cbegin(), keys.cend(), search_key);
    if (pos == keys.cend()) return {};
    return leaf.values()[gsl::narrow_cast<std::size_t>(pos - keys.cbegin())];
  }

  /// Insert a value under a key iff there is no entry for that key.
  ///
  /// \return true iff the key value pair was inserted.
  [[nodiscard]] bool insert(Key insert_key, Value v);

  /// Return true iff the index holds no entries.
  [[nodiscard]] bool empty() const noexcept { return entries == 0; }

  /// Return the number of entries in the index.
  [[nodiscard]] std::size_t size() const noexcept { return entries; }

  [[nodiscard]] std::size_t order() const noexcept { return max_keys; }

  /// Return the number of levels, 1 for a tree whose root is a leaf.
  [[nodiscard]] std::size_t height() const noexcept {
    std::size_t result{1};
    for (auto id = root_node; !nodes[id].is_leaf();
         id = nodes[id].children().front())
      ++result;
    return result;
  }

  //
  // Read-only structure access, exposed for verification and diagnostics.
  //

  [[nodiscard]] node_id root() const noexcept { return root_node; }

  /// Return the leftmost leaf, the start of the leaf chain.
  [[nodiscard]] node_id first_leaf() const noexcept {
    auto id = root_node;
    while (!nodes[id].is_leaf()) id = nodes[id].children().front();
    return id;
  }

  [[nodiscard]] const node &get_node(node_id id) const noexcept {
    SPLITIDX_DETAIL_ASSERT(id < nodes.size());
    return nodes[id];
  }

  /// Return the number of allocated nodes, including the retired ones.
  [[nodiscard]] std::size_t node_count() const noexcept { return nodes.size(); }

  // Stats

#ifdef SPLITIDX_DETAIL_WITH_STATS

  template <node_type NodeType>
  [[nodiscard]] constexpr auto get_node_count() const noexcept {
    return node_counts[as_i<NodeType>];
  }

  [[nodiscard]] constexpr auto get_node_counts() const noexcept {
    return node_counts;
  }

  [[nodiscard]] constexpr auto get_leaf_splits() const noexcept {
    return leaf_splits;
  }

  [[nodiscard]] constexpr auto get_inode_splits() const noexcept {
    return inode_splits;
  }

  [[nodiscard]] constexpr auto get_root_splits() const noexcept {
    return root_splits;
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
  /// A split's outcome: the key to insert into the parent and the new right
  /// sibling.
  struct split_result {
    Key separator;
    node_id sibling;
  };

  /// Descend from the root to the leaf that owns \a k. A key equal to a
  /// separator routes into the right subtree.
  [[nodiscard]] node_id find_leaf(const Key &k) const noexcept {
    auto id = root_node;
    while (!nodes[id].is_leaf()) {
      const auto &n = nodes[id];
      const auto &keys = n.keys();
      const auto pos = std::upper_bound(keys.cbegin(), keys.cend(), k);
      id = n.children()[gsl::narrow_cast<std::size_t>(pos - keys.cbegin())];
    }
    return id;
  }

  [[nodiscard]] node_id new_node(node &&n);

  [[nodiscard]] split_result split_leaf(node_id id);

  [[nodiscard]] split_result split_inode(node_id id);

  /// Split \a id and, as long as the parent receiving the separator reaches
  /// the order too, each ancestor in turn.
  void split_node(node_id id);

  [[gnu::cold]] void dump_subtree(std::ostream &os, node_id id,
                                  std::size_t level) const;

  std::vector<node> nodes;

  node_id root_node{detail::null_node};

  std::size_t entries{0};

  const std::size_t max_keys;

#ifdef SPLITIDX_DETAIL_WITH_STATS

  node_type_counter_array node_counts{};

  std::uint64_t leaf_splits{0};
  std::uint64_t inode_splits{0};
  std::uint64_t root_splits{0};

#endif  // SPLITIDX_DETAIL_WITH_STATS
};

template <typename Key, typename Value>
bool bptree<Key, Value>::insert(Key insert_key, Value v) {
  if (empty()) {
    auto &root_leaf = nodes[root_node];
    SPLITIDX_DETAIL_ASSERT(root_leaf.is_leaf());
    SPLITIDX_DETAIL_ASSERT(root_leaf.keys_.empty());
    root_leaf.keys_.push_back(std::move(insert_key));
    root_leaf.leaf().values.push_back(std::move(v));
    ++entries;
    return true;
  }

  const auto leaf_id = find_leaf(insert_key);
  auto &leaf = nodes[leaf_id];
  auto &keys = leaf.keys_;
  const auto pos = std::lower_bound(keys.begin(), keys.end(), insert_key);
  if (pos != keys.end() && !(insert_key < *pos)) return false;

  auto &values = leaf.leaf().values;
  const auto i = pos - keys.begin();
  values.insert(values.begin() + i, std::move(v));
  keys.insert(pos, std::move(insert_key));
  ++entries;

  if (keys.size() >= max_keys) split_node(leaf_id);
  return true;
}

template <typename Key, typename Value>
typename bptree<Key, Value>::node_id bptree<Key, Value>::new_node(node &&n) {
  if (SPLITIDX_DETAIL_UNLIKELY(nodes.size() >= detail::null_node)) {
    throw std::length_error("B+ tree node arena is full");  // LCOV_EXCL_LINE
  }
  const auto result = gsl::narrow_cast<node_id>(nodes.size());
#ifdef SPLITIDX_DETAIL_WITH_STATS
  if (n.is_leaf())
    ++node_counts[as_i<node_type::LEAF>];
  else
    ++node_counts[as_i<node_type::INTERNAL>];
#endif  // SPLITIDX_DETAIL_WITH_STATS
  nodes.push_back(std::move(n));
  return result;
}

template <typename Key, typename Value>
typename bptree<Key, Value>::split_result bptree<Key, Value>::split_leaf(
    node_id id) {
  // Allocate first: it may move every node in the arena
  const auto sibling_id = new_node(node::make_leaf(nodes[id].parent()));
  auto &left = nodes[id];
  auto &right = nodes[sibling_id];
  SPLITIDX_DETAIL_ASSERT(left.is_leaf());

  const auto mid = left.keys_.size() / 2;
  const auto key_split =
      left.keys_.begin() + gsl::narrow_cast<std::ptrdiff_t>(mid);
  right.keys_.assign(std::make_move_iterator(key_split),
                     std::make_move_iterator(left.keys_.end()));
  left.keys_.erase(key_split, left.keys_.end());

  auto &left_values = left.leaf().values;
  const auto value_split =
      left_values.begin() + gsl::narrow_cast<std::ptrdiff_t>(mid);
  right.leaf().values.assign(std::make_move_iterator(value_split),
                             std::make_move_iterator(left_values.end()));
  left_values.erase(value_split, left_values.end());

  right.leaf().next = left.leaf().next;
  left.leaf().next = sibling_id;

#ifdef SPLITIDX_DETAIL_WITH_STATS
  ++leaf_splits;
#endif  // SPLITIDX_DETAIL_WITH_STATS

  return {right.keys_.front(), sibling_id};
}

template <typename Key, typename Value>
typename bptree<Key, Value>::split_result bptree<Key, Value>::split_inode(
    node_id id) {
  const auto sibling_id = new_node(node::make_inode(nodes[id].parent()));
  auto &left = nodes[id];
  auto &right = nodes[sibling_id];
  SPLITIDX_DETAIL_ASSERT(!left.is_leaf());

  const auto mid = left.keys_.size() / 2;
  const auto key_split =
      left.keys_.begin() + gsl::narrow_cast<std::ptrdiff_t>(mid);
  // The middle key moves up and stays in neither half
  Key separator{std::move(*key_split)};
  right.keys_.assign(std::make_move_iterator(key_split + 1),
                     std::make_move_iterator(left.keys_.end()));
  left.keys_.erase(key_split, left.keys_.end());

  auto &left_children = left.inode().children;
  const auto child_split =
      left_children.begin() + gsl::narrow_cast<std::ptrdiff_t>(mid + 1);
  right.inode().children.assign(child_split, left_children.end());
  left_children.erase(child_split, left_children.end());

  for (const auto child : right.inode().children)
    nodes[child].parent_node = sibling_id;

  SPLITIDX_DETAIL_ASSERT(left.inode().children.size() == left.keys_.size() + 1);
  SPLITIDX_DETAIL_ASSERT(right.inode().children.size() ==
                         right.keys_.size() + 1);

#ifdef SPLITIDX_DETAIL_WITH_STATS
  ++inode_splits;
#endif  // SPLITIDX_DETAIL_WITH_STATS

  return {std::move(separator), sibling_id};
}

template <typename Key, typename Value>
void bptree<Key, Value>::split_node(node_id id) {
  while (nodes[id].keys().size() >= max_keys) {
    auto [separator, sibling] =
        nodes[id].is_leaf() ? split_leaf(id) : split_inode(id);
    const auto parent = nodes[id].parent();

    if (parent == detail::null_node) {
      const auto new_root = new_node(node::make_inode(detail::null_node));
      auto &root_inode = nodes[new_root];
      root_inode.keys_.push_back(std::move(separator));
      root_inode.inode().children = {id, sibling};
      nodes[id].parent_node = new_root;
      nodes[sibling].parent_node = new_root;
      root_node = new_root;
#ifdef SPLITIDX_DETAIL_WITH_STATS
      ++root_splits;
#endif  // SPLITIDX_DETAIL_WITH_STATS
      return;
    }

    auto &parent_inode = nodes[parent];
    auto &children = parent_inode.inode().children;
    const auto child_pos = std::find(children.begin(), children.end(), id);
    SPLITIDX_DETAIL_ASSERT(child_pos != children.end());
    const auto i = child_pos - children.begin();
    parent_inode.keys_.insert(parent_inode.keys_.begin() + i,
                              std::move(separator));
    children.insert(child_pos + 1, sibling);
    nodes[sibling].parent_node = parent;

    id = parent;
  }
}

template <typename Key, typename Value>
void bptree<Key, Value>::dump_subtree(std::ostream &os, node_id id,
                                      std::size_t level) const {
  const auto &n = nodes[id];
  os << std::string(level * 2, ' ');
  n.dump(os);
  os << '\n';
  if (n.is_leaf()) return;
  for (const auto child : n.children()) dump_subtree(os, child, level + 1);
}

template <typename Key, typename Value>
void bptree<Key, Value>::dump(std::ostream &os) const {
  os << "bptree dump, order = " << max_keys << ", entries = " << entries
     << ", height = " << height();
#ifdef SPLITIDX_DETAIL_WITH_STATS
  os << ", leaves = " << node_counts[as_i<node_type::LEAF>]
     << ", internal nodes = " << node_counts[as_i<node_type::INTERNAL>];
#endif  // SPLITIDX_DETAIL_WITH_STATS
  os << '\n';
  dump_subtree(os, root_node, 0);
}

// LCOV_EXCL_START
template <typename Key, typename Value>
void bptree<Key, Value>::dump() const {
  dump(std::cerr);
}
// LCOV_EXCL_STOP

}  // namespace splitidx

#endif  // SPLITIDX_DETAIL_BPTREE_HPP
