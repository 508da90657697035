#pragma once

// cmd_new: create a fresh correlation vector and print it as JSON.
// Usage: cvec_cli new [--seed <32 hex chars>]
int cmd_new(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
