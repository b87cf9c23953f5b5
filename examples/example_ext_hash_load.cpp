// Copyright 2025-2026 SplitIdx contributors

// Loads newline-delimited integer keys from a file into a splitidx::ext_hash
// and prints the resulting table. If a store directory is given, the buckets
// and the table metadata are persisted there.

#include "global.hpp"  // IWYU pragma: keep

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

#include "bucket_store.hpp"
#include "bulk_load.hpp"
#include "ext_hash.hpp"

int main(int argc, char *argv[]) {
  if (argc != 2 && argc != 3) {
    std::cerr << "Usage: " << argv[0] << " <key-file> [store-dir]\n";
    return EXIT_FAILURE;
  }

  try {
    std::unique_ptr<splitidx::file_bucket_store> store;
    if (argc == 3)
      store = std::make_unique<splitidx::file_bucket_store>(argv[2]);

    splitidx::ext_hash<> table{2, 1, store.get()};
    const auto stats = splitidx::load_keys_from_file(table, argv[1]);
    std::cout << "Loaded " << argv[1] << ": " << stats << '\n';
    table.dump(std::cout);
    std::cout << "Number of buckets: " << table.bucket_count() << '\n';
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
