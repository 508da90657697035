#pragma once

// cmd_inspect: parse a correlation vector string and print its JSON description.
// Usage: cvec_cli inspect <cv>
int cmd_inspect(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
