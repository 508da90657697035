#pragma once

#include "cvec/core/clock.h"
#include "cvec/core/random_source.h"
#include "cvec/core/result.h"
#include "cvec/vector/parse_error.h"
#include "cvec/vector/spin_params.h"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace cvec::vector {

// kMaxSerializedLength is the wire ceiling, terminator included.
constexpr std::size_t kMaxSerializedLength = 128;
// kMaxDataLength is the budget for base and counters; the last byte is reserved for '!'.
constexpr std::size_t kMaxDataLength = kMaxSerializedLength - 1;

constexpr char kSeparator = '.';
constexpr char kTerminator = '!';

// VectorState is a one-way state machine: kMutable -> kImmutable.
// The transition happens when a mutation would push the data part past kMaxDataLength.
enum class VectorState : uint8_t {
  kMutable,
  kImmutable,
};

// CorrelationVector is a base identity followed by a dot-separated counter sequence:
//
//   cv      := base "." counter ("." counter)* ["!"]
//   counter := 1*DIGIT   (unsigned 32-bit)
//
// It is a plain value. It is not thread-safe; fork it by copying, never by sharing.
//
// Every mutation is total: it either applies, or flips the vector to kImmutable and drops
// the change. Callers that need to know whether a mutation took effect compare
// serialized_length() or state() before and after.
//
// Invariants:
// - counters() is never empty
// - serialized_length() == format().size() <= kMaxSerializedLength
// - format() ends with '!' iff state() == kImmutable
class CorrelationVector {
 public:
  // Fresh vector from the process-wide random source.
  CorrelationVector();

  [[nodiscard]] static CorrelationVector create();
  [[nodiscard]] static CorrelationVector create(core::IRandomSource& random);

  // Base is the padding-stripped base64 encoding of seed; counters are [0].
  [[nodiscard]] static CorrelationVector create_from_seed(const core::Seed& seed);

  // parse accepts the wire form. The base segment is copied verbatim and never validated.
  // serialized_length() is set to input.size(), terminator included.
  [[nodiscard]] static core::Result<CorrelationVector, ParseError> parse(std::string_view input);

  // extend appends a 0 counter.
  void extend();

  // increment adds one to the last counter.
  void increment();

  // spin appends a partly time-derived, partly random value (one or two counters)
  // followed by a 0 counter. Use when increment cannot guarantee uniqueness, e.g.
  // across restarts or hosts with skewed clocks.
  void spin(const SpinParams& params = kDefaultSpinParams);
  void spin(const SpinParams& params, core::IRandomSource& random, core::ITickClock& clock);

  [[nodiscard]] std::string format() const;

  [[nodiscard]] const std::string& base() const { return base_; }
  [[nodiscard]] const std::vector<std::uint32_t>& counters() const { return counters_; }
  [[nodiscard]] VectorState state() const { return state_; }
  [[nodiscard]] bool is_immutable() const { return state_ == VectorState::kImmutable; }
  [[nodiscard]] std::size_t serialized_length() const { return serialized_length_; }

  bool operator==(const CorrelationVector&) const = default;

 private:
  CorrelationVector(std::string base, std::vector<std::uint32_t> counters, VectorState state,
                    std::size_t serialized_length);

  // try_append appends value if the data budget allows it; otherwise terminates the vector.
  // Returns false when the vector was terminated.
  bool try_append(std::uint32_t value);

  // terminate flips to kImmutable and accounts for the '!' byte.
  void terminate();

  std::string base_;
  std::vector<std::uint32_t> counters_;
  VectorState state_{VectorState::kMutable};
  std::size_t serialized_length_{0};
};

std::ostream& operator<<(std::ostream& os, const CorrelationVector& cv);

// decimal_length returns the number of decimal digits needed to print value.
[[nodiscard]] std::size_t decimal_length(std::uint32_t value);

}  // namespace cvec::vector
