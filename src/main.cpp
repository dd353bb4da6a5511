#include "core/options.hpp"
#include "core/runner.hpp"
#include <iostream>

int main(int argc, char **argv) {
  auto opt = ParseArgs(argc, argv);
  if (!opt) {
    std::cerr << "Error: " << opt.error() << "\n\n" << Usage();
    return 2;
  }
  if (opt->show_help) {
    std::cout << Usage();
    return 0;
  }
  if (auto valid = ValidateOptions(*opt); !valid) {
    std::cerr << "Error: " << valid.error() << "\n";
    return 1;
  }
  return Run(*opt);
}
