#pragma once

#include "cvec/vector/correlation_vector.h"
#include "cvec/vector/parse_error.h"

#include <nlohmann/json.hpp>

#include <string>

namespace cvec::vector {

/// Describe a CorrelationVector as JSON:
/// {"base", "counters", "immutable", "serialized_length", "value"}
[[nodiscard]] nlohmann::json correlation_vector_to_json(const CorrelationVector& cv);

/// Describe a ParseError as JSON: {"error", "counter_error", "counter_index"}
[[nodiscard]] nlohmann::json parse_error_to_json(const ParseError& error);

/// Serialize to stable JSON string (sorted keys, no whitespace)
[[nodiscard]] std::string correlation_vector_to_json_string(const CorrelationVector& cv);

}  // namespace cvec::vector
