#pragma once

#include "cvec/core/clock.h"
#include "cvec/core/random_source.h"
#include "cvec/vector/correlation_vector.h"
#include "cvec/vector/spin_params.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class MutateOp : uint8_t {
  kExtend,
  kIncrement,
  kSpin,
};

// parse_mutate_op maps "extend" | "increment" | "spin" to a MutateOp.
[[nodiscard]] std::optional<MutateOp> parse_mutate_op(std::string_view s);

// apply_mutations applies ops to cv in order. Ops after the vector becomes immutable are no-ops.
void apply_mutations(cvec::vector::CorrelationVector& cv, const std::vector<MutateOp>& ops,
                     const cvec::vector::SpinParams& params, cvec::core::IRandomSource& random,
                     cvec::core::ITickClock& clock);

// execute_mutate: parse input, apply ops and print the resulting JSON. Returns a process exit code.
int execute_mutate(const std::string& input, const std::vector<MutateOp>& ops,
                   const cvec::vector::SpinParams& params, cvec::core::IRandomSource& random,
                   cvec::core::ITickClock& clock);
