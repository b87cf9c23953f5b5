// Copyright 2025-2026 SplitIdx contributors

//
// CAUTION: [global.hpp] MUST BE THE FIRST INCLUDE IN ALL SOURCE AND
// HEADER FILES !!!
//
// This header defines _GLIBCXX_DEBUG and _GLIBCXX_DEBUG_PEDANTIC for
// DEBUG builds.  If some standard headers are included before and
// after those symbols are defined, then that results in different
// container internal structure layouts and that is Not Good.
#include "global.hpp"  // IWYU pragma: keep

#include "bptree.hpp"

#include <cstdint>
#include <iostream>  // IWYU pragma: keep

#include "assert.hpp"
#include "node_type.hpp"

namespace splitidx {

std::ostream &operator<<(std::ostream &os, node_type type) {
  switch (type) {
    case node_type::LEAF:
      return os << 'L';
    case node_type::INTERNAL:
      return os << 'I';
  }
  SPLITIDX_DETAIL_CANNOT_HAPPEN();
}

}  // namespace splitidx

// Unroll splitidx::bptree templates here.
template class splitidx::bptree<std::int64_t, std::int64_t>;
