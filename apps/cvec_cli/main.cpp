#include "commands/inspect.h"
#include "commands/mutate.h"
#include "commands/new_vector.h"

#include "cvec/core/version.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "cvec_cli v" << cvec::core::kBuildVersion << "\n"
            << "Usage:\n"
            << "  cvec_cli new [--seed <32 hex chars>]\n"
            << "  cvec_cli inspect <cv>\n"
            << "  cvec_cli mutate <cv> <extend|increment|spin>... [--entropy <0-4>]\n"
            << "                  [--interval <coarse|fine>] "
               "[--periodicity <none|short|medium|long>]\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "new") {
    return cmd_new(argc, argv);
  }
  if (subcommand == "inspect") {
    return cmd_inspect(argc, argv);
  }
  if (subcommand == "mutate") {
    return cmd_mutate(argc, argv);
  }
  if (subcommand == "--version") {
    std::cout << cvec::core::kBuildVersion << "\n";
    return 0;
  }

  std::cerr << "Unknown subcommand: " << subcommand << "\n";
  print_usage();
  return 1;
}
