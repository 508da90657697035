#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <utility>
#include <vector>

namespace cvec::core {

// Seed is the 128-bit value a correlation vector base is derived from.
using Seed = std::array<std::uint8_t, 16>;

// Abstract random source for dependency injection.
// Production code draws from a process-wide PRNG while tests supply fixed bytes.
// Randomness here is a uniqueness aid, not a security mechanism.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IRandomSource {
 public:
  virtual ~IRandomSource() = default;

  // Return the next 128 random bits.
  virtual Seed next_seed() = 0;

  // Return exactly count random bytes.
  virtual std::vector<std::uint8_t> next_bytes(std::size_t count) = 0;

 protected:
  IRandomSource() = default;
  IRandomSource(const IRandomSource&) = default;
  IRandomSource& operator=(const IRandomSource&) = default;
  IRandomSource(IRandomSource&&) = default;
  IRandomSource& operator=(IRandomSource&&) = default;
};

// Production random source: mt19937_64 seeded once through a std::seed_seq of
// several std::random_device draws, so distinct instances do not share a stream.
// Thread-safe. A single instance may be shared by every vector in the process.
class SystemRandomSource final : public IRandomSource {
 public:
  SystemRandomSource();
  ~SystemRandomSource() override = default;

  // Not copyable or movable (contains mutex)
  SystemRandomSource(const SystemRandomSource&) = delete;
  SystemRandomSource& operator=(const SystemRandomSource&) = delete;
  SystemRandomSource(SystemRandomSource&&) = delete;
  SystemRandomSource& operator=(SystemRandomSource&&) = delete;

  Seed next_seed() override;
  std::vector<std::uint8_t> next_bytes(std::size_t count) override;

 private:
  std::mutex mutex_;
  std::mt19937_64 engine_;
};

// Deterministic random source: replays a fixed byte pattern, cycling when exhausted.
// For tests and demos where reproducible output is required.
// An empty pattern yields zero bytes.
class SequenceRandomSource final : public IRandomSource {
 public:
  explicit SequenceRandomSource(std::vector<std::uint8_t> pattern) : pattern_(std::move(pattern)) {}
  ~SequenceRandomSource() override = default;

  SequenceRandomSource(const SequenceRandomSource&) = default;
  SequenceRandomSource& operator=(const SequenceRandomSource&) = default;
  SequenceRandomSource(SequenceRandomSource&&) = default;
  SequenceRandomSource& operator=(SequenceRandomSource&&) = default;

  Seed next_seed() override;
  std::vector<std::uint8_t> next_bytes(std::size_t count) override;

 private:
  std::uint8_t next_byte();

  std::vector<std::uint8_t> pattern_;
  std::size_t position_{0};
};

// default_random_source returns the process-wide SystemRandomSource.
IRandomSource& default_random_source();

}  // namespace cvec::core
