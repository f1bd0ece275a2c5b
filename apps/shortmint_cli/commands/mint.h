#pragma once

// cmd_mint: mint --count short codes for --machine-id and print them as JSON lines.
int cmd_mint(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
