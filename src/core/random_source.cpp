#include "cvec/core/random_source.h"

#include <algorithm>

namespace cvec::core {

namespace {

// kSeedWords: random_device draws fed to the engine, enough to cover a 128-bit output.
constexpr std::size_t kSeedWords = 8;

std::mt19937_64 make_seeded_engine() {
  std::random_device device;
  std::array<std::random_device::result_type, kSeedWords> words{};
  std::generate(words.begin(), words.end(), [&device] { return device(); });
  std::seed_seq seq(words.begin(), words.end());
  return std::mt19937_64(seq);
}

}  // namespace

SystemRandomSource::SystemRandomSource() : engine_(make_seeded_engine()) {}

Seed SystemRandomSource::next_seed() {
  std::uint64_t high = 0;
  std::uint64_t low = 0;
  {
    // std::mt19937_64 is not thread-safe by default
    std::lock_guard<std::mutex> lock(mutex_);
    high = engine_();
    low = engine_();
  }

  Seed seed{};
  for (std::size_t i = 0; i < 8u; ++i) {
    const auto shift = static_cast<unsigned>((7u - i) * 8u);
    seed[i] = static_cast<std::uint8_t>((high >> shift) & 0xFFu);
    seed[i + 8u] = static_cast<std::uint8_t>((low >> shift) & 0xFFu);
  }
  return seed;
}

std::vector<std::uint8_t> SystemRandomSource::next_bytes(const std::size_t count) {
  std::vector<std::uint8_t> bytes;
  bytes.reserve(count);

  std::lock_guard<std::mutex> lock(mutex_);
  while (bytes.size() < count) {
    std::uint64_t word = engine_();
    for (std::size_t i = 0; i < 8u && bytes.size() < count; ++i) {
      bytes.push_back(static_cast<std::uint8_t>(word & 0xFFu));
      word >>= 8u;
    }
  }
  return bytes;
}

Seed SequenceRandomSource::next_seed() {
  Seed seed{};
  for (auto& byte : seed) {
    byte = next_byte();
  }
  return seed;
}

std::vector<std::uint8_t> SequenceRandomSource::next_bytes(const std::size_t count) {
  std::vector<std::uint8_t> bytes(count);
  for (auto& byte : bytes) {
    byte = next_byte();
  }
  return bytes;
}

std::uint8_t SequenceRandomSource::next_byte() {
  if (pattern_.empty()) {
    return 0;
  }
  const std::uint8_t byte = pattern_[position_];
  position_ = (position_ + 1u) % pattern_.size();
  return byte;
}

IRandomSource& default_random_source() {
  static SystemRandomSource source;
  return source;
}

}  // namespace cvec::core
