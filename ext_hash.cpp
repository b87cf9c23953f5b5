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

#include "ext_hash.hpp"

#include <cstdint>

#include "fixed_hash.hpp"

// Unroll splitidx::ext_hash templates here.
template class splitidx::ext_hash<std::int64_t, std::int64_t,
                                  splitidx::fixed_hash<std::int64_t>>;
template class splitidx::ext_hash<std::int64_t, std::int64_t,
                                  splitidx::identity_hash>;
