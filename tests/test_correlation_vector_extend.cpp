#include "cvec/vector/correlation_vector.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <string>

using namespace cvec::vector;

TEST_CASE("extend appends a zero counter", "[vector][extend]") {
  auto cv = CorrelationVector::create_from_seed(cvec::core::Seed{});
  cv.extend();

  const auto s = cv.format();
  CHECK(s == "AAAAAAAAAAAAAAAAAAAAAA.0.0");
  CHECK(std::count(s.begin(), s.end(), '.') == 2);
  CHECK(cv.serialized_length() == 26);
}

TEST_CASE("extend stops at the length budget and terminates", "[vector][extend]") {
  auto cv = CorrelationVector::create_from_seed(cvec::core::Seed{});
  for (int i = 0; i < 128; ++i) {
    cv.extend();
    REQUIRE(cv.format().size() == cv.serialized_length());
  }

  const auto s = cv.format();
  CHECK(s.size() <= kMaxSerializedLength);
  CHECK(s.ends_with("!"));
  CHECK(cv.is_immutable());
  // 24 + 2 * 51 = 126; the 52nd extend would need 128 data bytes.
  CHECK(cv.counters().size() == 52);
  CHECK(cv.serialized_length() == 127);
}

TEST_CASE("extend is a no-op once immutable", "[vector][extend]") {
  auto result = CorrelationVector::parse("base.0!");
  REQUIRE(result.has_value());
  auto& cv = result.value();
  const auto before = cv;

  cv.extend();
  CHECK(cv == before);
}

TEST_CASE("extend that would reach 128 data bytes is dropped", "[vector][extend]") {
  // 126 bytes: one more ".0" would make 128.
  auto result = CorrelationVector::parse(std::string(124, 'x') + ".0");
  REQUIRE(result.has_value());
  auto& cv = result.value();
  REQUIRE(cv.serialized_length() == 126);

  cv.extend();
  CHECK(cv.is_immutable());
  CHECK(cv.counters().size() == 1);
  CHECK(cv.serialized_length() == 127);
  CHECK(cv.format() == std::string(124, 'x') + ".0!");
}

TEST_CASE("extend that lands exactly on 127 data bytes is applied", "[vector][extend]") {
  auto result = CorrelationVector::parse(std::string(123, 'x') + ".0");
  REQUIRE(result.has_value());
  auto& cv = result.value();
  REQUIRE(cv.serialized_length() == 125);

  cv.extend();
  CHECK_FALSE(cv.is_immutable());
  CHECK(cv.serialized_length() == 127);

  cv.extend();
  CHECK(cv.is_immutable());
  CHECK(cv.format().size() == 128);
}
