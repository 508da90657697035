#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cvec::vector {

// Error enumerations following E.14 (use purpose-designed types as error indicators).

// ParseErrorKind classifies why a wire string is not a correlation vector.
enum class ParseErrorKind : uint8_t {
  kEmpty,           // nothing left after removing the terminator
  kMissingVector,   // a base segment with no counters
  kInvalidCounter,  // a counter segment is not an unsigned 32-bit decimal
  kStringTooLong,   // over 128 bytes, or exactly 128 without the terminator
};

// CounterError is the underlying numeric failure wrapped by kInvalidCounter.
enum class CounterError : uint8_t {
  kNone,
  kEmpty,         // zero-length segment, e.g. "base..1"
  kInvalidDigit,  // any character outside '0'-'9'
  kOutOfRange,    // value above 4294967295
};

struct ParseError {
  ParseErrorKind kind;                     // NOLINT(readability-identifier-naming)
  CounterError counter_error{CounterError::kNone};  // NOLINT(readability-identifier-naming)
  // Zero-based index of the offending counter (0 is the first counter after the base).
  // Only meaningful for kInvalidCounter.
  std::size_t counter_index{0};  // NOLINT(readability-identifier-naming)

  bool operator==(const ParseError&) const = default;
};

[[nodiscard]] std::string_view to_string(ParseErrorKind kind);
[[nodiscard]] std::string_view to_string(CounterError error);

// to_string renders a ParseError as a single diagnostic line, e.g.
// "invalid counter at index 2: invalid digit".
[[nodiscard]] std::string to_string(const ParseError& error);

}  // namespace cvec::vector
