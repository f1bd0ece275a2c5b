#pragma once

// cmd_decode: decode one or more short codes into their fields.
// cmd_layout: print the identifier bit layout and epoch window.
int cmd_decode(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
int cmd_layout(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
