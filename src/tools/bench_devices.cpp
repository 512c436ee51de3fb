#include "analog-bench/BenchConfig.hpp"
#include "analog-bench/Logger.hpp"
#include "analog-bench/discovery/AnalogDiscovery.hpp"
#include "analog-bench/dwf/DwfScopeDriver.hpp"
#include "analog-bench/errors.hpp"
#include "analog-bench/m1k/LibsmuDriver.hpp"
#include <iostream>
#include <memory>

void print_usage(const char *prog) {
  std::cout << "Usage: " << prog << " <command>\n\n";
  std::cout << "Commands:\n";
  std::cout << "  list-devices              List attached instruments\n";
  std::cout << "  analog-discovery          List Analog Discovery devices\n";
  std::cout << "  adalm1k                   List ADALM1000 devices\n";
}

namespace {

int list_analog_discovery() {
  using namespace analogbench;
  try {
    discovery::AnalogDiscovery ad(std::make_unique<dwf::DwfScopeDriver>());
    std::cout << "WaveForms runtime " << ad.library_version() << "\n";
    auto devices = ad.devices_info();
    std::cout << "Found " << devices.size() << " Analog Discovery device(s):\n";
    for (const auto &dev : devices) {
      std::cout << "  [" << dev.index << "] " << dev.name
                << "  SN: " << dev.serial << "  rev: " << dev.revision
                << "\n";
    }
    return 0;
  } catch (const BenchError &ex) {
    std::cerr << "Analog Discovery: " << ex.what() << "\n";
    return 1;
  }
}

int list_adalm1k() {
  using namespace analogbench;
  try {
    m1k::LibsmuDriver driver;
    auto serials = driver.scan();
    std::cout << "Found " << serials.size() << " ADALM1K device(s):\n";
    for (std::size_t i = 0; i < serials.size(); ++i) {
      std::cout << "  [" << i << "] SN: " << serials[i] << "\n";
    }
    return 0;
  } catch (const BenchError &ex) {
    std::cerr << "ADALM1K: " << ex.what() << "\n";
    return 1;
  }
}

} // namespace

int main(int argc, char **argv) {
  using namespace analogbench;

  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  std::string command = argv[1];

  BenchLogger::instance().init("analog_bench_devices.log",
                               spdlog::level::info);

  if (command == "list-devices") {
    int ad = list_analog_discovery();
    int smu = list_adalm1k();
    return ad == 0 && smu == 0 ? 0 : 1;
  } else if (command == "analog-discovery") {
    return list_analog_discovery();
  } else if (command == "adalm1k") {
    return list_adalm1k();
  }

  std::cerr << "Unknown command: " << command << "\n\n";
  print_usage(argv[0]);
  return 1;
}
