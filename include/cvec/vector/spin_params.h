#pragma once

// SpinParams — configuration vocabulary for CorrelationVector::spin.
//
// C++ Core Guidelines Enum.2: use enumerations to represent sets of related named constants.
// The compiler warns on incomplete switch statements, so adding an enumerator forces every
// mapping below to be updated.
//
// CLI flags: --entropy <0-4>, --interval <coarse|fine>, --periodicity <none|short|medium|long>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cvec::vector {

// SpinCounterInterval selects how many low bits of the 100 ns tick count are discarded.
enum class SpinCounterInterval : uint8_t {
  kCoarse,  // "coarse" — drops 24 bits (~1.67 s resolution)
  kFine,    // "fine"   — drops 16 bits (~6.5 ms resolution)
};

// SpinCounterPeriodicity selects how many bits of the shifted tick count are retained.
enum class SpinCounterPeriodicity : uint8_t {
  kNone,    // "none"   — 0 bits
  kShort,   // "short"  — 16 bits
  kMedium,  // "medium" — 24 bits
  kLong,    // "long"   — 32 bits
};

// SpinEntropy selects how many random bytes are mixed below the tick bits.
enum class SpinEntropy : uint8_t {
  kNone,   // "0"
  kOne,    // "1"
  kTwo,    // "2"
  kThree,  // "3"
  kFour,   // "4"
};

struct SpinParams {
  SpinCounterInterval interval{SpinCounterInterval::kCoarse};          // NOLINT(readability-identifier-naming)
  SpinCounterPeriodicity periodicity{SpinCounterPeriodicity::kShort};  // NOLINT(readability-identifier-naming)
  SpinEntropy entropy{SpinEntropy::kTwo};                              // NOLINT(readability-identifier-naming)

  bool operator==(const SpinParams&) const = default;
};

// kDefaultSpinParams mirrors the protocol's recommended defaults.
constexpr SpinParams kDefaultSpinParams{};

// ticks_to_drop returns the number of low tick bits discarded for an interval.
[[nodiscard]] constexpr unsigned ticks_to_drop(const SpinCounterInterval interval) {
  switch (interval) {
    case SpinCounterInterval::kCoarse:
      return 24;
    case SpinCounterInterval::kFine:
      return 16;
  }
  return 24;  // unreachable — all enumerators covered above
}

// counter_bits returns the number of tick bits retained for a periodicity.
[[nodiscard]] constexpr unsigned counter_bits(const SpinCounterPeriodicity periodicity) {
  switch (periodicity) {
    case SpinCounterPeriodicity::kNone:
      return 0;
    case SpinCounterPeriodicity::kShort:
      return 16;
    case SpinCounterPeriodicity::kMedium:
      return 24;
    case SpinCounterPeriodicity::kLong:
      return 32;
  }
  return 0;  // unreachable
}

[[nodiscard]] constexpr unsigned entropy_bytes(const SpinEntropy entropy) {
  return static_cast<unsigned>(entropy);
}

// spin_value_bits returns the total width of a spin value: counter bits plus entropy bits.
// Always in [0, 64].
[[nodiscard]] constexpr unsigned spin_value_bits(const SpinParams& params) {
  return counter_bits(params.periodicity) + entropy_bytes(params.entropy) * 8u;
}

// Flag-value parsers. Return std::nullopt for unrecognised values (including empty string).
// Case-sensitive: "fine" matches, "Fine" does not.
[[nodiscard]] std::optional<SpinCounterInterval> parse_spin_counter_interval(std::string_view s);
[[nodiscard]] std::optional<SpinCounterPeriodicity> parse_spin_counter_periodicity(
    std::string_view s);
[[nodiscard]] std::optional<SpinEntropy> parse_spin_entropy(std::string_view s);

// to_string returns the canonical flag string for each enumerator.
[[nodiscard]] std::string_view to_string(SpinCounterInterval interval);
[[nodiscard]] std::string_view to_string(SpinCounterPeriodicity periodicity);
[[nodiscard]] std::string_view to_string(SpinEntropy entropy);

// spin_params_to_log_string returns a deterministic, human-readable rendering
// for diagnostics. Format: "interval=fine periodicity=short entropy=2"
[[nodiscard]] std::string spin_params_to_log_string(const SpinParams& params);

}  // namespace cvec::vector
