#include "decode.h"

#include "decode_logic.h"
#include <iostream>
#include <string>
#include <vector>

int cmd_decode(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  // Usage: shortmint_cli decode <code> [<code>...]
  if (argc < 3) {
    std::cerr << "Usage: shortmint_cli decode <code> [<code>...]\n";
    return 1;
  }

  std::vector<std::string> codes;
  for (int i = 2; i < argc; ++i) {
    codes.emplace_back(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  }
  return execute_decode(codes, std::cout, std::cerr);
}

int cmd_layout(int /*argc*/, char* /*argv*/[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::cout << layout_to_json().dump(2) << "\n";
  return 0;
}
