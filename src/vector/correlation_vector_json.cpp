#include "cvec/vector/correlation_vector_json.h"

namespace cvec::vector {

nlohmann::json correlation_vector_to_json(const CorrelationVector& cv) {
  nlohmann::json j;
  j["base"] = cv.base();
  j["counters"] = cv.counters();
  j["immutable"] = cv.is_immutable();
  j["serialized_length"] = cv.serialized_length();
  j["value"] = cv.format();
  return j;
}

nlohmann::json parse_error_to_json(const ParseError& error) {
  nlohmann::json j;
  j["error"] = std::string{to_string(error.kind)};
  if (error.kind == ParseErrorKind::kInvalidCounter) {
    j["counter_error"] = std::string{to_string(error.counter_error)};
    j["counter_index"] = error.counter_index;
  }
  return j;
}

std::string correlation_vector_to_json_string(const CorrelationVector& cv) {
  // nlohmann::json objects keep keys sorted, so dump() is stable.
  return correlation_vector_to_json(cv).dump();
}

}  // namespace cvec::vector
