#pragma once

#include "cvec/core/random_source.h"

#include <optional>
#include <string_view>

// parse_seed_hex parses exactly 32 hexadecimal characters (either case) into a 128-bit seed.
// Returns std::nullopt for any other input.
[[nodiscard]] std::optional<cvec::core::Seed> parse_seed_hex(std::string_view hex);

// execute_new: build a vector from seed when given, otherwise from random, and print its JSON.
int execute_new(const std::optional<cvec::core::Seed>& seed, cvec::core::IRandomSource& random);
