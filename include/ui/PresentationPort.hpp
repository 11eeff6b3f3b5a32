#pragma once
/** @file  PresentationPort.hpp
 *  @brief Observer interface the monitor core notifies (table + log front end).
 *
 *  © 2025 Qube Monitor — MIT-licensed.
 */

#include <string>

#include "core/Types.hpp"

namespace qube {
  namespace ui {

    /**
 * @class PresentationPort
 * @brief Whatever renders the student table and the activity log.
 *
 * * The core never pushes snapshots: on a change notification the front end
 *   re-reads `sortedView()` / `durationOf()` / `filteredLog()` itself.
 * * Calls arrive from the read loop, the health loop or the operator thread;
 *   implementations must be thread-safe and return quickly.
 */
    class PresentationPort {
    public:
      virtual ~PresentationPort() = default;

      /// Link status line, e.g. ("Connected", Green) or ("Reconnect failed", Red).
      virtual void onConnectionStatus(const std::string& text, core::Color color) = 0;

      virtual void onStudentStatusChanged(core::StudentId id) = 0;

      virtual void onLogUpdated() = 0;
    };

  } // namespace ui
} // namespace qube
