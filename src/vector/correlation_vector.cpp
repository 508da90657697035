#include "cvec/vector/correlation_vector.h"

#include "cvec/core/base64.h"

#include <charconv>
#include <limits>
#include <ostream>
#include <system_error>
#include <utility>

namespace cvec::vector {

namespace {

struct CounterParse {
  std::uint32_t value{0};
  CounterError error{CounterError::kNone};
};

// parse_counter is a checked conversion: values above 2^32-1 are rejected, never wrapped.
// Signs, whitespace and any other non-digit characters are rejected.
CounterParse parse_counter(const std::string_view segment) {
  if (segment.empty()) {
    return {0, CounterError::kEmpty};
  }
  for (const char c : segment) {
    if (c < '0' || c > '9') {
      return {0, CounterError::kInvalidDigit};
    }
  }

  std::uint32_t value = 0;
  const auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), value);
  if (ec == std::errc::result_out_of_range) {
    return {0, CounterError::kOutOfRange};
  }
  if (ec != std::errc{} || ptr != segment.data() + segment.size()) {
    return {0, CounterError::kInvalidDigit};
  }
  return {value, CounterError::kNone};
}

}  // namespace

std::size_t decimal_length(std::uint32_t value) {
  std::size_t length = 1;
  while (value >= 10u) {
    value /= 10u;
    ++length;
  }
  return length;
}

CorrelationVector::CorrelationVector() : CorrelationVector(create()) {}

CorrelationVector::CorrelationVector(std::string base, std::vector<std::uint32_t> counters,
                                     const VectorState state, const std::size_t serialized_length)
    : base_(std::move(base)),
      counters_(std::move(counters)),
      state_(state),
      serialized_length_(serialized_length) {}

CorrelationVector CorrelationVector::create() {
  return create(core::default_random_source());
}

CorrelationVector CorrelationVector::create(core::IRandomSource& random) {
  return create_from_seed(random.next_seed());
}

CorrelationVector CorrelationVector::create_from_seed(const core::Seed& seed) {
  std::string base = core::strip_base64_padding(core::base64_encode(seed));
  // ".0"
  const std::size_t length = base.size() + 2u;
  return CorrelationVector(std::move(base), {0u}, VectorState::kMutable, length);
}

core::Result<CorrelationVector, ParseError> CorrelationVector::parse(const std::string_view input) {
  using ParseResult = core::Result<CorrelationVector, ParseError>;

  const bool terminated = !input.empty() && input.back() == kTerminator;

  // A full-length string is only valid when it is already terminated:
  // there is no room left to append the terminator later.
  if (input.size() > kMaxSerializedLength ||
      (input.size() == kMaxSerializedLength && !terminated)) {
    return ParseResult::err(ParseError{ParseErrorKind::kStringTooLong});
  }

  std::string_view body = input;
  if (terminated) {
    body.remove_suffix(1);
  }
  if (body.empty()) {
    return ParseResult::err(ParseError{ParseErrorKind::kEmpty});
  }

  const auto base_end = body.find(kSeparator);
  if (base_end == std::string_view::npos) {
    return ParseResult::err(ParseError{ParseErrorKind::kMissingVector});
  }

  std::vector<std::uint32_t> counters;
  std::string_view rest = body.substr(base_end + 1u);
  for (std::size_t index = 0;; ++index) {
    const auto next = rest.find(kSeparator);
    const auto [value, error] = parse_counter(rest.substr(0, next));
    if (error != CounterError::kNone) {
      return ParseResult::err(ParseError{ParseErrorKind::kInvalidCounter, error, index});
    }
    counters.push_back(value);
    if (next == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(next + 1u);
  }

  return ParseResult::ok(CorrelationVector(
      std::string{body.substr(0, base_end)}, std::move(counters),
      terminated ? VectorState::kImmutable : VectorState::kMutable, input.size()));
}

void CorrelationVector::extend() {
  if (is_immutable()) {
    return;
  }
  try_append(0u);
}

void CorrelationVector::increment() {
  if (is_immutable()) {
    return;
  }

  std::uint32_t& last = counters_.back();
  if (last == std::numeric_limits<std::uint32_t>::max()) {
    // The counter cannot grow without wrapping.
    terminate();
    return;
  }

  // At most one extra digit per increment (9 -> 10, 99 -> 100, ...).
  const std::size_t growth = decimal_length(last + 1u) - decimal_length(last);
  if (growth > 0u) {
    if (serialized_length_ + growth > kMaxDataLength) {
      terminate();
      return;
    }
    serialized_length_ += growth;
  }
  ++last;
}

void CorrelationVector::spin(const SpinParams& params) {
  spin(params, core::default_random_source(), core::default_tick_clock());
}

void CorrelationVector::spin(const SpinParams& params, core::IRandomSource& random,
                             core::ITickClock& clock) {
  if (is_immutable()) {
    return;
  }

  const auto entropy = random.next_bytes(entropy_bytes(params.entropy));

  std::uint64_t value = clock.now_ticks() >> ticks_to_drop(params.interval);
  // Entropy is shifted in below the ticks, most significant byte first.
  for (const std::uint8_t byte : entropy) {
    value = (value << 8u) | static_cast<std::uint64_t>(byte);
  }

  const unsigned bits = spin_value_bits(params);
  if (bits < 64u) {
    value &= (std::uint64_t{1} << bits) - 1u;
  }

  // Each append is checked on its own. The first one that does not fit terminates the
  // vector and leaves any earlier appends of this call in place.
  if (!try_append(static_cast<std::uint32_t>(value & 0xFFFFFFFFu))) {
    return;
  }
  if (bits > 32u && !try_append(static_cast<std::uint32_t>(value >> 32u))) {
    return;
  }
  try_append(0u);
}

std::string CorrelationVector::format() const {
  std::string out;
  out.reserve(serialized_length_);
  out += base_;
  for (const std::uint32_t counter : counters_) {
    out.push_back(kSeparator);
    out += std::to_string(counter);
  }
  if (is_immutable()) {
    out.push_back(kTerminator);
  }
  return out;
}

bool CorrelationVector::try_append(const std::uint32_t value) {
  const std::size_t extension = decimal_length(value) + 1u;
  if (serialized_length_ + extension > kMaxDataLength) {
    terminate();
    return false;
  }
  counters_.push_back(value);
  serialized_length_ += extension;
  return true;
}

void CorrelationVector::terminate() {
  state_ = VectorState::kImmutable;
  serialized_length_ += 1u;
}

std::ostream& operator<<(std::ostream& os, const CorrelationVector& cv) {
  return os << cv.format();
}

}  // namespace cvec::vector
