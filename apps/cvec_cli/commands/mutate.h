#pragma once

// cmd_mutate: parse a correlation vector, apply operations in order, print the result as JSON.
// Usage: cvec_cli mutate <cv> <extend|increment|spin>... [--entropy <0-4>]
//                                                       [--interval <coarse|fine>]
//                                                       [--periodicity <none|short|medium|long>]
int cmd_mutate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
