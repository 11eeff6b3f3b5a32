#pragma once
/** @file  PortScanner.hpp
 *  @brief Enumerates the serial devices the host currently exposes.
 *
 *  © 2025 Qube Monitor — MIT-licensed.
 */

#include <string>
#include <vector>

namespace qube {
  namespace io {

    /**
 * @class PortScanner
 * @brief Walks /sys/class/tty and reports every driver-backed tty as `/dev/<name>`.
 *
 *  * Legacy 8250 UART placeholders (ttyS* without hardware) are skipped.
 *  * Never throws: a filesystem error yields an empty list.
 *  * Virtual so the link self-test can be driven with a scripted port list.
 */
    class PortScanner {
    public:
      explicit PortScanner(std::string sysfsRoot = "/sys/class/tty");
      virtual ~PortScanner() = default;

      /// Sorted device paths, e.g. {"/dev/ttyACM0", "/dev/ttyUSB0"}.
      virtual std::vector<std::string> list() const;

      /// True if \p port is among `list()`.
      bool contains(const std::string& port) const;

    private:
      std::string root_;
    };

  } // namespace io
} // namespace qube
