// Copyright 2025-2026 SplitIdx contributors

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

#include <cstddef>
#include <cstdint>

#include <benchmark/benchmark.h>

#include "bptree.hpp"
#include "micro_benchmark_utils.hpp"
#include "node_type.hpp"

namespace {

#ifdef SPLITIDX_DETAIL_WITH_STATS

void set_tree_counters(benchmark::State &state,
                       const splitidx::benchmark::bptree &tree) {
  state.counters["L"] = static_cast<double>(
      tree.get_node_count<splitidx::node_type::LEAF>());
  state.counters["I"] = static_cast<double>(
      tree.get_node_count<splitidx::node_type::INTERNAL>());
  state.counters["height"] = static_cast<double>(tree.height());
}

#endif  // SPLITIDX_DETAIL_WITH_STATS

void dense_insert(benchmark::State &state) {
  const auto order = static_cast<std::size_t>(state.range(1));
  for (const auto _ : state) {
    state.PauseTiming();
    splitidx::benchmark::bptree tree{order};
    benchmark::ClobberMemory();
    state.ResumeTiming();

    for (std::int64_t i = 0; i < state.range(0); ++i)
      splitidx::benchmark::insert_key(tree, i);

    state.PauseTiming();
#ifdef SPLITIDX_DETAIL_WITH_STATS
    set_tree_counters(state, tree);
#endif  // SPLITIDX_DETAIL_WITH_STATS
  }

  state.SetItemsProcessed(state.iterations() * state.range(0));
}

void sparse_insert_dups_allowed(benchmark::State &state) {
  splitidx::benchmark::batched_prng random_keys;
  const auto order = static_cast<std::size_t>(state.range(1));

  for (const auto _ : state) {
    state.PauseTiming();
    splitidx::benchmark::bptree tree{order};
    benchmark::ClobberMemory();
    state.ResumeTiming();

    for (auto i = 0; i < state.range(0); ++i) {
      const auto random_key = random_keys.get(state);
      splitidx::benchmark::insert_key_ignore_dups(tree, random_key);
    }

    state.PauseTiming();
#ifdef SPLITIDX_DETAIL_WITH_STATS
    set_tree_counters(state, tree);
#endif  // SPLITIDX_DETAIL_WITH_STATS
  }

  state.SetItemsProcessed(state.iterations() * state.range(0));
}

constexpr auto full_scan_multiplier = 50;

// Inserts a sequence of keys, then gets each of them in key order
void dense_full_get(benchmark::State &state) {
  splitidx::benchmark::bptree tree{static_cast<std::size_t>(state.range(1))};
  const auto key_limit = state.range(0);

  for (std::int64_t i = 0; i < key_limit; ++i)
    splitidx::benchmark::insert_key(tree, i);

  for (const auto _ : state)
    for (auto i = 0; i < full_scan_multiplier; ++i)
      for (std::int64_t j = 0; j < key_limit; ++j)
        splitidx::benchmark::get_existing_key(tree, j);

  state.SetItemsProcessed(state.iterations() * state.range(0) *
                          full_scan_multiplier);
#ifdef SPLITIDX_DETAIL_WITH_STATS
  set_tree_counters(state, tree);
#endif  // SPLITIDX_DETAIL_WITH_STATS
}

void sparse_get_missing(benchmark::State &state) {
  splitidx::benchmark::bptree tree{static_cast<std::size_t>(state.range(1))};
  splitidx::benchmark::batched_prng random_keys;

  // Even keys present, odd keys probed
  for (std::int64_t i = 0; i < state.range(0); ++i)
    splitidx::benchmark::insert_key(tree, i * 2);

  for (const auto _ : state) {
    for (auto i = 0; i < state.range(0); ++i) {
      const auto random_key = random_keys.get(state) | 1;
      splitidx::benchmark::get_key(tree, random_key);
    }
  }

  state.SetItemsProcessed(state.iterations() * state.range(0));
}

void key_count_and_order_args(benchmark::internal::Benchmark *b) {
  for (auto i = 100; i <= 1000000; i *= 10)
    for (auto order : {4, 16, 64}) b->Args({i, order});
}

}  // namespace

SPLITIDX_START_BENCHMARKS()

BENCHMARK(dense_insert)
    ->Apply(key_count_and_order_args)
    ->Unit(benchmark::kMicrosecond);
BENCHMARK(sparse_insert_dups_allowed)
    ->Apply(key_count_and_order_args)
    ->Unit(benchmark::kMicrosecond);
BENCHMARK(dense_full_get)
    ->Apply(key_count_and_order_args)
    ->Unit(benchmark::kMicrosecond);
BENCHMARK(sparse_get_missing)
    ->Apply(key_count_and_order_args)
    ->Unit(benchmark::kMicrosecond);

SPLITIDX_BENCHMARK_MAIN();
