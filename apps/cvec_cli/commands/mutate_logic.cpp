#include "mutate_logic.h"

#include "cvec/vector/correlation_vector_json.h"

#include <iostream>

std::optional<MutateOp> parse_mutate_op(const std::string_view s) {
  if (s == "extend") {
    return MutateOp::kExtend;
  }
  if (s == "increment") {
    return MutateOp::kIncrement;
  }
  if (s == "spin") {
    return MutateOp::kSpin;
  }
  return std::nullopt;
}

void apply_mutations(cvec::vector::CorrelationVector& cv, const std::vector<MutateOp>& ops,
                     const cvec::vector::SpinParams& params, cvec::core::IRandomSource& random,
                     cvec::core::ITickClock& clock) {
  for (const MutateOp op : ops) {
    switch (op) {
      case MutateOp::kExtend:
        cv.extend();
        break;
      case MutateOp::kIncrement:
        cv.increment();
        break;
      case MutateOp::kSpin:
        cv.spin(params, random, clock);
        break;
    }
  }
}

int execute_mutate(const std::string& input, const std::vector<MutateOp>& ops,
                   const cvec::vector::SpinParams& params, cvec::core::IRandomSource& random,
                   cvec::core::ITickClock& clock) {
  auto result = cvec::vector::CorrelationVector::parse(input);
  if (!result.has_value()) {
    std::cerr << "Failed to parse correlation vector: " << cvec::vector::to_string(result.error())
              << "\n";
    return 1;
  }

  auto& cv = result.value();
  const bool was_immutable = cv.is_immutable();
  apply_mutations(cv, ops, params, random, clock);

  if (!was_immutable && cv.is_immutable()) {
    std::cerr << "Length budget exhausted; vector is now terminated\n";
  }
  std::cout << cvec::vector::correlation_vector_to_json(cv).dump(2) << "\n";
  return 0;
}
