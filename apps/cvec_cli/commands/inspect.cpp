#include "inspect.h"

#include "cvec/vector/correlation_vector.h"
#include "cvec/vector/correlation_vector_json.h"

#include <iostream>
#include <string>

int cmd_inspect(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  if (argc != 3) {
    std::cerr << "Usage: cvec_cli inspect <cv>\n";
    return 1;
  }

  const std::string input = argv[2];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto result = cvec::vector::CorrelationVector::parse(input);
  if (!result.has_value()) {
    std::cerr << "Failed to parse correlation vector: " << cvec::vector::to_string(result.error())
              << "\n";
    std::cout << cvec::vector::parse_error_to_json(result.error()).dump(2) << "\n";
    return 1;
  }

  std::cout << cvec::vector::correlation_vector_to_json(result.value()).dump(2) << "\n";
  return 0;
}
