/* @file main.cpp
 * @brief qube_monitor entry point: load config, wire the core, run the console
 *
 * usage: qube_monitor [config.json] [serial-port]
 *
 * © 2025 Qube Monitor — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>
#include <memory>

// nlohmann headers
#include <nlohmann/json.hpp>

// Qube headers
#include "core/ConfigLoader.hpp"
#include "core/MonitorConfig.hpp"
#include "core/MonitorCoordinator.hpp"
#include "ui/ConsolePresentation.hpp"

using namespace qube;

int main(int argc, char* argv[]) {
  core::MonitorConfig config;
  if (argc > 1) {
    try {
      config = core::MonitorConfig::fromJson(core::ConfigLoader(argv[1]).load());
    } catch (const std::exception& e) {
      std::cerr << "[QubeMonitor] " << e.what() << '\n';
      return 1;
    }
  }

  core::MonitorCoordinator coordinator(config);
  auto console = std::make_shared<ui::ConsolePresentation>(coordinator, std::cout);
  coordinator.attach(console);

  if (argc > 2)
    coordinator.connect(argv[2]);

  console->run(std::cin);

  coordinator.disconnect();
  coordinator.attach(nullptr);
  return 0;
}
