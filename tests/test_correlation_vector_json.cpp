#include "cvec/vector/correlation_vector_json.h"

#include <catch2/catch.hpp>

using namespace cvec::vector;

TEST_CASE("correlation_vector_to_json describes the vector", "[vector][json]") {
  auto cv = CorrelationVector::create_from_seed(cvec::core::Seed{});
  cv.extend();
  cv.increment();

  const auto j = correlation_vector_to_json(cv);
  CHECK(j.at("base") == "AAAAAAAAAAAAAAAAAAAAAA");
  CHECK(j.at("counters") == nlohmann::json::array({0, 1}));
  CHECK(j.at("immutable") == false);
  CHECK(j.at("serialized_length") == 26);
  CHECK(j.at("value") == "AAAAAAAAAAAAAAAAAAAAAA.0.1");
}

TEST_CASE("correlation_vector_to_json_string is stable", "[vector][json]") {
  const auto cv = CorrelationVector::create_from_seed(cvec::core::Seed{});
  const auto s1 = correlation_vector_to_json_string(cv);
  const auto s2 = correlation_vector_to_json_string(cv);
  CHECK(s1 == s2);
  CHECK(s1 ==
        R"({"base":"AAAAAAAAAAAAAAAAAAAAAA","counters":[0],"immutable":false,)"
        R"("serialized_length":24,"value":"AAAAAAAAAAAAAAAAAAAAAA.0"})");
}

TEST_CASE("parse_error_to_json includes counter detail only for counter errors",
          "[vector][json]") {
  const auto empty = parse_error_to_json(ParseError{ParseErrorKind::kEmpty});
  CHECK(empty.at("error") == "empty input");
  CHECK_FALSE(empty.contains("counter_error"));

  const auto counter = parse_error_to_json(
      ParseError{ParseErrorKind::kInvalidCounter, CounterError::kInvalidDigit, 3});
  CHECK(counter.at("error") == "invalid counter");
  CHECK(counter.at("counter_error") == "invalid digit");
  CHECK(counter.at("counter_index") == 3);
}
