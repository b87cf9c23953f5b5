// Copyright 2025-2026 SplitIdx contributors

// Loads newline-delimited integer keys from a file into a splitidx::bptree and
// prints the resulting tree.

#include "global.hpp"  // IWYU pragma: keep

#include <cstdlib>
#include <exception>
#include <iostream>

#include "bptree.hpp"
#include "bulk_load.hpp"

int main(int argc, char *argv[]) {
  if (argc != 2) {
    std::cerr << "Usage: " << argv[0] << " <key-file>\n";
    return EXIT_FAILURE;
  }

  try {
    splitidx::bptree<> tree;
    const auto stats = splitidx::load_keys_from_file(tree, argv[1]);
    std::cout << "Loaded " << argv[1] << ": " << stats << '\n';
    tree.dump(std::cout);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
