#include "mutate.h"

#include "mutate_logic.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr const char* kUsage =
    "Usage: cvec_cli mutate <cv> <extend|increment|spin>... [--entropy <0-4>] "
    "[--interval <coarse|fine>] [--periodicity <none|short|medium|long>]\n";

}  // namespace

int cmd_mutate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  using cvec::vector::SpinParams;

  const std::vector<cvec::apps::Option<SpinParams>> options = {
      {"--entropy", true, "Random bytes mixed into spin values (0-4)",
       [](SpinParams& p, const std::string& v) {
         const auto entropy = cvec::vector::parse_spin_entropy(v);
         if (entropy.has_value()) {
           p.entropy = entropy.value();
           return true;
         }
         std::cerr << "Invalid --entropy: " << v << " (valid: 0, 1, 2, 3, 4)\n";
         return false;
       }},
      {"--interval", true, "Spin tick resolution (coarse|fine)",
       [](SpinParams& p, const std::string& v) {
         const auto interval = cvec::vector::parse_spin_counter_interval(v);
         if (interval.has_value()) {
           p.interval = interval.value();
           return true;
         }
         std::cerr << "Invalid --interval: " << v << " (valid: coarse, fine)\n";
         return false;
       }},
      {"--periodicity", true, "Spin tick bits kept (none|short|medium|long)",
       [](SpinParams& p, const std::string& v) {
         const auto periodicity = cvec::vector::parse_spin_counter_periodicity(v);
         if (periodicity.has_value()) {
           p.periodicity = periodicity.value();
           return true;
         }
         std::cerr << "Invalid --periodicity: " << v << " (valid: none, short, medium, long)\n";
         return false;
       }},
  };
  const auto parsed =
      cvec::apps::parse_options(argc, argv, options, 2, cvec::vector::kDefaultSpinParams);
  if (!parsed.ok || parsed.positionals.empty()) {
    std::cerr << kUsage;
    return 1;
  }

  std::vector<MutateOp> ops;
  for (std::size_t i = 1; i < parsed.positionals.size(); ++i) {
    const auto op = parse_mutate_op(parsed.positionals[i]);
    if (!op.has_value()) {
      std::cerr << "Unknown operation: " << parsed.positionals[i]
                << " (valid: extend, increment, spin)\n";
      return 1;
    }
    ops.push_back(op.value());
  }

  std::cerr << "Spin parameters: " << cvec::vector::spin_params_to_log_string(parsed.config)
            << "\n";
  return execute_mutate(parsed.positionals.front(), ops, parsed.config,
                        cvec::core::default_random_source(), cvec::core::default_tick_clock());
}
