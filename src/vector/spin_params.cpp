#include "cvec/vector/spin_params.h"

namespace cvec::vector {

std::optional<SpinCounterInterval> parse_spin_counter_interval(const std::string_view s) {
  if (s == "coarse") {
    return SpinCounterInterval::kCoarse;
  }
  if (s == "fine") {
    return SpinCounterInterval::kFine;
  }
  return std::nullopt;
}

std::optional<SpinCounterPeriodicity> parse_spin_counter_periodicity(const std::string_view s) {
  if (s == "none") {
    return SpinCounterPeriodicity::kNone;
  }
  if (s == "short") {
    return SpinCounterPeriodicity::kShort;
  }
  if (s == "medium") {
    return SpinCounterPeriodicity::kMedium;
  }
  if (s == "long") {
    return SpinCounterPeriodicity::kLong;
  }
  return std::nullopt;
}

std::optional<SpinEntropy> parse_spin_entropy(const std::string_view s) {
  // Exactly one digit 0-4.
  if (s.size() != 1 || s[0] < '0' || s[0] > '4') {
    return std::nullopt;
  }
  return static_cast<SpinEntropy>(s[0] - '0');
}

std::string_view to_string(const SpinCounterInterval interval) {
  switch (interval) {
    case SpinCounterInterval::kCoarse:
      return "coarse";
    case SpinCounterInterval::kFine:
      return "fine";
  }
  return "unknown";  // unreachable — all enumerators covered above
}

std::string_view to_string(const SpinCounterPeriodicity periodicity) {
  switch (periodicity) {
    case SpinCounterPeriodicity::kNone:
      return "none";
    case SpinCounterPeriodicity::kShort:
      return "short";
    case SpinCounterPeriodicity::kMedium:
      return "medium";
    case SpinCounterPeriodicity::kLong:
      return "long";
  }
  return "unknown";
}

std::string_view to_string(const SpinEntropy entropy) {
  switch (entropy) {
    case SpinEntropy::kNone:
      return "0";
    case SpinEntropy::kOne:
      return "1";
    case SpinEntropy::kTwo:
      return "2";
    case SpinEntropy::kThree:
      return "3";
    case SpinEntropy::kFour:
      return "4";
  }
  return "unknown";
}

std::string spin_params_to_log_string(const SpinParams& params) {
  std::string out = "interval=";
  out += to_string(params.interval);
  out += " periodicity=";
  out += to_string(params.periodicity);
  out += " entropy=";
  out += to_string(params.entropy);
  return out;
}

}  // namespace cvec::vector
