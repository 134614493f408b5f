// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <chain_containers/sorted_chain.hpp>
#include <iostream>
#include <lyra/lyra.hpp>

using namespace kressler::chain_containers;

int main(int argc, char** argv) {
  // Command line parameters
  bool show_help = false;
  bool verbose = false;
  int first_low = -50;
  int first_high = 50;
  int second_low = -5;
  int second_high = 15;
  int repeated = 2;
  int repeat_count = 50;

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(first_low, "low")["--first-low"](
          "Start of the first inserted range (inclusive)") |
      lyra::opt(first_high, "high")["--first-high"](
          "End of the first inserted range (exclusive)") |
      lyra::opt(second_low, "low")["--second-low"](
          "Start of the second inserted range (inclusive)") |
      lyra::opt(second_high, "high")["--second-high"](
          "End of the second inserted range (exclusive)") |
      lyra::opt(repeated, "value")["-r"]["--repeat-value"](
          "Value inserted repeatedly at the end") |
      lyra::opt(repeat_count, "count")["-n"]["--repeat-count"](
          "How many times to insert the repeated value") |
      lyra::opt(verbose)["-v"]["--verbose"](
          "Print one node per line with its range");

  // Parse command line
  auto result = cli.parse({argc, argv});

  // Check for errors
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    std::cerr << cli << std::endl;
    return 1;
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  sorted_chain<int, 15> chain;

  for (int i = first_low; i < first_high; ++i) {
    chain.insert(i);
  }
  for (int i = second_low; i < second_high; ++i) {
    chain.insert(i);
  }
  for (int i = 0; i < repeat_count; ++i) {
    chain.insert(repeated);
  }

  if (verbose) {
    print_structure(std::cout, chain);
  } else {
    std::cout << chain << std::endl;
  }

  std::cout << "Inserted " << chain.size() << " elements into "
            << chain.node_count() << " nodes" << std::endl;
  if (auto pos = chain.find(repeated)) {
    std::cout << "First " << repeated << " at position " << *pos << std::endl;
  }

  return 0;
}
