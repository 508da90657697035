#include "cvec/vector/parse_error.h"

namespace cvec::vector {

std::string_view to_string(const ParseErrorKind kind) {
  switch (kind) {
    case ParseErrorKind::kEmpty:
      return "empty input";
    case ParseErrorKind::kMissingVector:
      return "missing vector";
    case ParseErrorKind::kInvalidCounter:
      return "invalid counter";
    case ParseErrorKind::kStringTooLong:
      return "string too long";
  }
  return "unknown";  // unreachable — all enumerators covered above
}

std::string_view to_string(const CounterError error) {
  switch (error) {
    case CounterError::kNone:
      return "none";
    case CounterError::kEmpty:
      return "empty segment";
    case CounterError::kInvalidDigit:
      return "invalid digit";
    case CounterError::kOutOfRange:
      return "out of range";
  }
  return "unknown";  // unreachable
}

std::string to_string(const ParseError& error) {
  std::string out{to_string(error.kind)};
  if (error.kind == ParseErrorKind::kInvalidCounter) {
    out += " at index " + std::to_string(error.counter_index) + ": ";
    out += to_string(error.counter_error);
  }
  return out;
}

}  // namespace cvec::vector
