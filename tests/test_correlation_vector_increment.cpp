#include "cvec/vector/correlation_vector.h"

#include <catch2/catch.hpp>

#include <string>

using namespace cvec::vector;

namespace {

CorrelationVector parsed(const std::string& input) {
  auto result = CorrelationVector::parse(input);
  REQUIRE(result.has_value());
  return result.value();
}

}  // namespace

TEST_CASE("increment on a fresh vector ends in 1", "[vector][increment]") {
  auto cv = CorrelationVector::create();
  const auto length = cv.serialized_length();
  cv.increment();

  CHECK(cv.format().ends_with(".1"));
  CHECK(cv.serialized_length() == length);
}

TEST_CASE("increment only touches the last counter", "[vector][increment]") {
  auto cv = parsed("base.5.7");
  cv.increment();
  const std::vector<std::uint32_t> expected{5, 8};
  CHECK(cv.counters() == expected);
  CHECK(cv.format() == "base.5.8");
}

TEST_CASE("increment across a power of ten grows the length by one", "[vector][increment]") {
  auto cv = parsed("base.9");
  cv.increment();
  CHECK(cv.format() == "base.10");
  CHECK(cv.serialized_length() == 7);

  auto big = parsed("base.999999999");
  big.increment();
  CHECK(big.format() == "base.1000000000");
  CHECK(big.serialized_length() == big.format().size());
}

TEST_CASE("increment without a new digit keeps the length", "[vector][increment]") {
  auto cv = parsed("base.19");
  cv.increment();
  CHECK(cv.format() == "base.20");
  CHECK(cv.serialized_length() == 7);
}

TEST_CASE("increment at the budget terminates instead of growing", "[vector][increment]") {
  const std::string input =
      "P9v1ltK2S7qTS77z0lWtKg.0.386394219.0.386383989.0.386344389.0.386372594.0.386391233.0."
      "386360320.0.386386342.0.386341105.12344459";
  REQUIRE(input.size() == 127);
  auto cv = parsed(input);

  cv.increment();
  auto s = cv.format();
  CHECK(s.size() == 128);
  CHECK(s.ends_with("!"));
  CHECK(cv.counters().back() == 12344459);
  CHECK(cv.serialized_length() == 128);

  cv.increment();
  s = cv.format();
  CHECK(s.size() == 128);
  CHECK(s.ends_with("!"));
}

TEST_CASE("increment that stays within the budget at 127 bytes is applied", "[vector][increment]") {
  auto cv = parsed(std::string(125, 'x') + ".4");
  cv.increment();
  CHECK_FALSE(cv.is_immutable());
  CHECK(cv.format() == std::string(125, 'x') + ".5");
}

TEST_CASE("increment of the largest counter terminates without wrapping", "[vector][increment]") {
  auto cv = parsed("base.4294967295");
  cv.increment();
  CHECK(cv.is_immutable());
  CHECK(cv.counters().back() == 4294967295u);
  CHECK(cv.format() == "base.4294967295!");
  CHECK(cv.serialized_length() == cv.format().size());
}

TEST_CASE("increment is a no-op once immutable", "[vector][increment]") {
  auto cv = parsed("base.3!");
  cv.increment();
  CHECK(cv.format() == "base.3!");
}
