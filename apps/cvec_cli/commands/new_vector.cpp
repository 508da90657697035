#include "new_vector.h"

#include "new_vector_logic.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct NewCliConfig {
  std::optional<cvec::core::Seed> seed;
};

}  // namespace

int cmd_new(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<cvec::apps::Option<NewCliConfig>> options = {
      {"--seed", true, "128-bit seed as 32 hex characters",
       [](NewCliConfig& c, const std::string& v) {
         c.seed = parse_seed_hex(v);
         if (c.seed.has_value()) {
           return true;
         }
         std::cerr << "Invalid --seed: " << v << " (expected 32 hex characters)\n";
         return false;
       }},
  };
  const auto parsed = cvec::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    return 1;
  }
  if (!parsed.positionals.empty()) {
    std::cerr << "Usage: cvec_cli new [--seed <32 hex chars>]\n";
    return 1;
  }

  return execute_new(parsed.config.seed, cvec::core::default_random_source());
}
