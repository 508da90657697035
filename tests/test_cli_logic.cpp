#include "cvec_cli/commands/mutate_logic.h"
#include "cvec_cli/commands/new_vector_logic.h"

#include <catch2/catch.hpp>

using namespace cvec::vector;
using cvec::core::FixedTickClock;
using cvec::core::SequenceRandomSource;

TEST_CASE("parse_seed_hex accepts 32 hex characters", "[cli][new]") {
  const auto seed = parse_seed_hex("000102030405060708090a0B0c0D0e0F");
  REQUIRE(seed.has_value());
  CHECK(CorrelationVector::create_from_seed(seed.value()).base() == "AAECAwQFBgcICQoLDA0ODw");
}

TEST_CASE("parse_seed_hex rejects malformed input", "[cli][new]") {
  CHECK_FALSE(parse_seed_hex("").has_value());
  CHECK_FALSE(parse_seed_hex("00").has_value());
  CHECK_FALSE(parse_seed_hex("000102030405060708090a0b0c0d0e0f00").has_value());
  CHECK_FALSE(parse_seed_hex("g00102030405060708090a0b0c0d0e0f").has_value());
}

TEST_CASE("execute_new succeeds with and without a seed", "[cli][new]") {
  SequenceRandomSource random({0x42});
  CHECK(execute_new(std::nullopt, random) == 0);
  CHECK(execute_new(cvec::core::Seed{}, random) == 0);
}

TEST_CASE("parse_mutate_op recognises each operation", "[cli][mutate]") {
  CHECK(parse_mutate_op("extend") == MutateOp::kExtend);
  CHECK(parse_mutate_op("increment") == MutateOp::kIncrement);
  CHECK(parse_mutate_op("spin") == MutateOp::kSpin);
  CHECK_FALSE(parse_mutate_op("Extend").has_value());
  CHECK_FALSE(parse_mutate_op("").has_value());
}

TEST_CASE("apply_mutations applies operations in order", "[cli][mutate]") {
  auto cv = CorrelationVector::create_from_seed(cvec::core::Seed{});
  SequenceRandomSource random({0xAA, 0xBB});
  FixedTickClock clock(0x0123456789ABCDEFull);

  apply_mutations(cv,
                  {MutateOp::kIncrement, MutateOp::kExtend, MutateOp::kIncrement,
                   MutateOp::kIncrement, MutateOp::kSpin},
                  SpinParams{SpinCounterInterval::kFine, SpinCounterPeriodicity::kShort,
                             SpinEntropy::kTwo},
                  random, clock);

  CHECK(cv.format() == "AAAAAAAAAAAAAAAAAAAAAA.1.2.2309728955.0");
}

TEST_CASE("execute_mutate reports parse failures", "[cli][mutate]") {
  SequenceRandomSource random(std::vector<std::uint8_t>{});
  FixedTickClock clock(0);
  CHECK(execute_mutate("onlybase", {MutateOp::kExtend}, kDefaultSpinParams, random, clock) == 1);
  CHECK(execute_mutate("base.0", {MutateOp::kExtend}, kDefaultSpinParams, random, clock) == 0);
}
