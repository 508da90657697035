#include "cvec/core/random_source.h"

#include <catch2/catch.hpp>

using namespace cvec::core;

TEST_CASE("SequenceRandomSource replays its pattern and cycles", "[core][random]") {
  SequenceRandomSource random({1, 2, 3});

  const std::vector<std::uint8_t> first{1, 2};
  const std::vector<std::uint8_t> second{3, 1, 2, 3};
  CHECK(random.next_bytes(2) == first);
  CHECK(random.next_bytes(4) == second);

  const Seed seed = random.next_seed();
  CHECK(seed[0] == 1);
  CHECK(seed[1] == 2);
  CHECK(seed[2] == 3);
  CHECK(seed[15] == 1);
}

TEST_CASE("SequenceRandomSource with an empty pattern yields zero bytes", "[core][random]") {
  SequenceRandomSource random(std::vector<std::uint8_t>{});
  const std::vector<std::uint8_t> zeros(3, 0);
  CHECK(random.next_bytes(3) == zeros);
  CHECK(random.next_seed() == Seed{});
}

TEST_CASE("SystemRandomSource returns the requested number of bytes", "[core][random]") {
  SystemRandomSource random;
  CHECK(random.next_bytes(0).empty());
  CHECK(random.next_bytes(4).size() == 4);
  CHECK(random.next_bytes(13).size() == 13);
}

TEST_CASE("SystemRandomSource seeds differ between draws", "[core][random]") {
  SystemRandomSource random;
  const Seed a = random.next_seed();
  const Seed b = random.next_seed();
  CHECK(a != b);
}

TEST_CASE("independently constructed SystemRandomSources do not share a stream",
          "[core][random]") {
  // Each instance is seeded from more than one 32-bit random_device draw.
  SystemRandomSource a;
  SystemRandomSource b;
  CHECK(a.next_seed() != b.next_seed());
}

TEST_CASE("default_random_source is a process-wide singleton", "[core][random]") {
  CHECK(&default_random_source() == &default_random_source());
}
