// Copyright 2025-2026 SplitIdx contributors
#ifndef SPLITIDX_DETAIL_MICRO_BENCHMARK_UTILS_HPP
#define SPLITIDX_DETAIL_MICRO_BENCHMARK_UTILS_HPP

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

#include <algorithm>
#include <cstdint>
#ifndef NDEBUG
#include <iostream>
#endif
#include <limits>
#include <random>
#include <vector>

#include <benchmark/benchmark.h>

#ifndef NDEBUG
#include "assert.hpp"
#endif
#include "bptree.hpp"
#include "ext_hash.hpp"

#define SPLITIDX_START_BENCHMARKS()           \
  SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26409) \
  SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26426)

#define SPLITIDX_BENCHMARK_MAIN()             \
  SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()     \
  SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()     \
  SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26485) \
  BENCHMARK_MAIN()                            \
  SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()

namespace splitidx::benchmark {

// Benchmarked index types

using bptree = splitidx::bptree<std::int64_t, std::int64_t>;
using ext_hash = splitidx::ext_hash<std::int64_t, std::int64_t>;

// PRNG

[[nodiscard]] inline auto &get_prng() {
  static std::random_device rd;
  static std::mt19937_64 gen{rd()};
  return gen;
}

/// Random keys, generated in batches outside of the timed region.
class [[nodiscard]] batched_prng final {
  using result_type = std::int64_t;

 public:
  explicit batched_prng(
      result_type max_value = std::numeric_limits<result_type>::max())
      : random_key_dist{0, max_value} {
    refill();
  }

  [[nodiscard]] auto get(::benchmark::State &state) {
    if (random_key_ptr == random_keys.cend()) {
      state.PauseTiming();
      refill();
      state.ResumeTiming();
    }
    return *(random_key_ptr++);
  }

 private:
  void refill() {
    std::generate(random_keys.begin(), random_keys.end(),
                  [this]() { return random_key_dist(get_prng()); });
    random_key_ptr = random_keys.cbegin();
  }

  static constexpr auto random_batch_size = 10000;

  std::vector<result_type> random_keys =
      std::vector<result_type>(random_batch_size);
  std::vector<result_type>::const_iterator random_key_ptr;

  std::uniform_int_distribution<result_type> random_key_dist;
};

// Inserts

template <class Index>
void insert_key_ignore_dups(Index &instance, std::int64_t k) {
  // Args to ::benchmark::DoNoOptimize cannot be const, thus silence MSVC static
  // analyzer on that
  SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26496)
  auto result = instance.insert(k, k);
  ::benchmark::DoNotOptimize(result);
  SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()
}

template <class Index>
void insert_key(Index &instance, std::int64_t k) {
  SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26496)
  auto result = instance.insert(k, k);
#ifndef NDEBUG
  if (!result) {
    std::cerr << "Failed to insert " << k << "\nCurrent index:";
    instance.dump(std::cerr);
    SPLITIDX_DETAIL_ASSERT(result);
  }
#endif
  ::benchmark::DoNotOptimize(result);
  SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()
}

// Gets

template <class Index>
void get_key(const Index &instance, std::int64_t k) {
  SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26496)
  auto result = instance.get(k);
  ::benchmark::DoNotOptimize(result);
  SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()
}

template <class Index>
void get_existing_key(const Index &instance, std::int64_t k) {
  SPLITIDX_DETAIL_DISABLE_MSVC_WARNING(26496)
  auto result = instance.get(k);
#ifndef NDEBUG
  if (!Index::key_found(result)) {
    std::cerr << "Failed to get existing " << k << "\nIndex:";
    instance.dump(std::cerr);
    SPLITIDX_DETAIL_CRASH();
  }
#endif
  ::benchmark::DoNotOptimize(result);
  SPLITIDX_DETAIL_RESTORE_MSVC_WARNINGS()
}

}  // namespace splitidx::benchmark

#endif  // SPLITIDX_DETAIL_MICRO_BENCHMARK_UTILS_HPP
