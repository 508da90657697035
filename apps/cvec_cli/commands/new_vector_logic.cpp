#include "new_vector_logic.h"

#include "cvec/vector/correlation_vector.h"
#include "cvec/vector/correlation_vector_json.h"

#include <iostream>

namespace {

std::optional<unsigned> hex_value(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<unsigned>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<unsigned>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<unsigned>(c - 'A' + 10);
  }
  return std::nullopt;
}

}  // namespace

std::optional<cvec::core::Seed> parse_seed_hex(const std::string_view hex) {
  cvec::core::Seed seed{};
  if (hex.size() != seed.size() * 2u) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < seed.size(); ++i) {
    const auto hi = hex_value(hex[i * 2u]);
    const auto lo = hex_value(hex[i * 2u + 1u]);
    if (!hi.has_value() || !lo.has_value()) {
      return std::nullopt;
    }
    seed[i] = static_cast<std::uint8_t>((hi.value() << 4u) | lo.value());
  }
  return seed;
}

int execute_new(const std::optional<cvec::core::Seed>& seed, cvec::core::IRandomSource& random) {
  const auto cv = seed.has_value() ? cvec::vector::CorrelationVector::create_from_seed(seed.value())
                                   : cvec::vector::CorrelationVector::create(random);
  std::cout << cvec::vector::correlation_vector_to_json(cv).dump(2) << "\n";
  return 0;
}
