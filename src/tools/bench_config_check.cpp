#include <analog-bench/BenchConfig.hpp>
#include <analog-bench/errors.hpp>
#include <iostream>
using namespace analogbench;

int main(int argc, char *argv[]) {
  if (argc != 2) {
    std::cerr << "Usage: " << argv[0] << " <analog_bench.yaml>\n";
    return 1;
  }
  try {
    auto config = BenchConfig::load(argv[1]);
    std::cout << "Validation succeeded.\n";
    std::cout << config.to_json().dump(2) << "\n";
    return 0;
  } catch (const ConfigError &ex) {
    std::cout << "Validation failed:\n";
    std::cout << "  - " << ex.what() << "\n";
    return 2;
  }
}
