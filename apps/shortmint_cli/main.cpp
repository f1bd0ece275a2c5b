#include "shortmint/core/version.h"

#include "commands/decode.h"
#include "commands/mint.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "shortmint v" << shortmint::core::kBuildVersion << "\n"
            << "Usage:\n"
            << "  shortmint_cli mint [--machine-id N] [--count K] [--db PATH] [--max-attempts M]\n"
            << "  shortmint_cli decode <code> [<code>...]\n"
            << "  shortmint_cli layout\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "mint") {
    return cmd_mint(argc, argv);
  }
  if (subcommand == "decode") {
    return cmd_decode(argc, argv);
  }
  if (subcommand == "layout") {
    return cmd_layout(argc, argv);
  }
  if (subcommand == "--version") {
    std::cout << shortmint::core::kBuildVersion << "\n";
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
