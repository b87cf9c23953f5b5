// Copyright 2025-2026 SplitIdx contributors

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

#include <cstddef>
#include <cstdint>

#include <benchmark/benchmark.h>

#include "bucket_store.hpp"
#include "ext_hash.hpp"
#include "micro_benchmark_utils.hpp"

namespace {

#ifdef SPLITIDX_DETAIL_WITH_STATS

void set_table_counters(benchmark::State &state,
                        const splitidx::benchmark::ext_hash &table) {
  state.counters["buckets"] = static_cast<double>(table.bucket_count());
  state.counters["global depth"] = static_cast<double>(table.global_depth());
  state.counters["splits"] = static_cast<double>(table.get_bucket_splits());
}

#endif  // SPLITIDX_DETAIL_WITH_STATS

void dense_insert(benchmark::State &state) {
  const auto capacity = static_cast<std::size_t>(state.range(1));
  for (const auto _ : state) {
    state.PauseTiming();
    splitidx::benchmark::ext_hash table{capacity};
    benchmark::ClobberMemory();
    state.ResumeTiming();

    for (std::int64_t i = 0; i < state.range(0); ++i)
      splitidx::benchmark::insert_key(table, i);

    state.PauseTiming();
#ifdef SPLITIDX_DETAIL_WITH_STATS
    set_table_counters(state, table);
#endif  // SPLITIDX_DETAIL_WITH_STATS
  }

  state.SetItemsProcessed(state.iterations() * state.range(0));
}

// Every modified bucket goes through the codec into an in-memory store
void dense_insert_persisted(benchmark::State &state) {
  const auto capacity = static_cast<std::size_t>(state.range(1));
  for (const auto _ : state) {
    state.PauseTiming();
    splitidx::memory_bucket_store store;
    splitidx::benchmark::ext_hash table{capacity, 1, &store};
    benchmark::ClobberMemory();
    state.ResumeTiming();

    for (std::int64_t i = 0; i < state.range(0); ++i)
      splitidx::benchmark::insert_key(table, i);

    state.PauseTiming();
    state.counters["saves"] = static_cast<double>(store.get_save_count());
  }

  state.SetItemsProcessed(state.iterations() * state.range(0));
}

void sparse_insert_dups_allowed(benchmark::State &state) {
  splitidx::benchmark::batched_prng random_keys;
  const auto capacity = static_cast<std::size_t>(state.range(1));

  for (const auto _ : state) {
    state.PauseTiming();
    splitidx::benchmark::ext_hash table{capacity};
    benchmark::ClobberMemory();
    state.ResumeTiming();

    for (auto i = 0; i < state.range(0); ++i) {
      const auto random_key = random_keys.get(state);
      splitidx::benchmark::insert_key_ignore_dups(table, random_key);
    }

    state.PauseTiming();
#ifdef SPLITIDX_DETAIL_WITH_STATS
    set_table_counters(state, table);
#endif  // SPLITIDX_DETAIL_WITH_STATS
  }

  state.SetItemsProcessed(state.iterations() * state.range(0));
}

constexpr auto full_scan_multiplier = 50;

void dense_full_get(benchmark::State &state) {
  splitidx::benchmark::ext_hash table{static_cast<std::size_t>(state.range(1))};
  const auto key_limit = state.range(0);

  for (std::int64_t i = 0; i < key_limit; ++i)
    splitidx::benchmark::insert_key(table, i);

  for (const auto _ : state)
    for (auto i = 0; i < full_scan_multiplier; ++i)
      for (std::int64_t j = 0; j < key_limit; ++j)
        splitidx::benchmark::get_existing_key(table, j);

  state.SetItemsProcessed(state.iterations() * state.range(0) *
                          full_scan_multiplier);
#ifdef SPLITIDX_DETAIL_WITH_STATS
  set_table_counters(state, table);
#endif  // SPLITIDX_DETAIL_WITH_STATS
}

void key_count_and_capacity_args(benchmark::internal::Benchmark *b) {
  for (auto i = 100; i <= 1000000; i *= 10)
    for (auto capacity : {4, 32, 256}) b->Args({i, capacity});
}

}  // namespace

SPLITIDX_START_BENCHMARKS()

BENCHMARK(dense_insert)
    ->Apply(key_count_and_capacity_args)
    ->Unit(benchmark::kMicrosecond);
BENCHMARK(dense_insert_persisted)
    ->Apply(key_count_and_capacity_args)
    ->Unit(benchmark::kMicrosecond);
BENCHMARK(sparse_insert_dups_allowed)
    ->Apply(key_count_and_capacity_args)
    ->Unit(benchmark::kMicrosecond);
BENCHMARK(dense_full_get)
    ->Apply(key_count_and_capacity_args)
    ->Unit(benchmark::kMicrosecond);

SPLITIDX_BENCHMARK_MAIN();
