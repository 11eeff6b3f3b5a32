/* @file PortScanner.cpp
 * @brief serial port discovery via sysfs
 *
 * © 2025 Qube Monitor — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <filesystem>
#include <system_error>

// Qube headers
#include "io/PortScanner.hpp"

using namespace qube::io;
namespace fs = std::filesystem;

PortScanner::PortScanner(std::string sysfsRoot) : root_(std::move(sysfsRoot)) {}

std::vector<std::string> PortScanner::list() const {
  std::vector<std::string> ports;
  std::error_code ec;

  fs::directory_iterator it(root_, ec);
  if (ec)
    return ports;

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec)
      break;
    const auto& entry = *it;
    const auto driver = entry.path() / "device" / "driver";
    if (!fs::exists(driver, ec) || ec)
      continue; // virtual tty (console, pts, ...)

    const auto name = entry.path().filename().string();
    const auto driverName = fs::canonical(driver, ec).filename().string();
    if (ec)
      continue;

    // 8250 registers ttyS0..ttyS31 whether or not a UART sits behind them
    if (driverName == "serial8250")
      continue;

    ports.push_back("/dev/" + name);
  }

  std::sort(ports.begin(), ports.end());
  return ports;
}

bool PortScanner::contains(const std::string& port) const {
  const auto ports = list();
  return std::find(ports.begin(), ports.end(), port) != ports.end();
}
