#pragma once
/** @file  ConsolePresentation.hpp
 *  @brief Line-oriented teacher console: prints notifications, runs typed commands.
 *
 *  © 2025 Qube Monitor — MIT-licensed.
 */

#include <atomic>
#include <iosfwd>
#include <mutex>
#include <string>

#include "ui/PresentationPort.hpp"

namespace qube {
  namespace core { // forward decls so we don’t pull core headers in
    class MonitorCoordinator;
  } // namespace core

  namespace ui {

    /**
 * @class ConsolePresentation
 * @brief PresentationPort for a terminal plus a tiny command interpreter.
 *
 * * Notifications may arrive on any thread; output is serialized on one mutex.
 * * `execute()` returns false once the operator asked to quit.
 */
    class ConsolePresentation : public PresentationPort {

    public:
      ConsolePresentation(core::MonitorCoordinator& coordinator, std::ostream& out);
      ~ConsolePresentation() override = default;

      // ---- PresentationPort ---------------------------------------------------
      void onConnectionStatus(const std::string& text, core::Color color) override;
      void onStudentStatusChanged(core::StudentId id) override;
      void onLogUpdated() override;

      // ---- command interpreter -----------------------------------------------
      bool execute(const std::string& commandLine);
      void run(std::istream& in); ///< prompt/execute until EOF or `quit`

    private:
      void printHelp();
      void printTable();
      void printLog();
      void printStats();
      void loadRoster(const std::string& path);
      void exportLog(const std::string& path);
      void setFilter(const std::string& category, const std::string& state);

      core::MonitorCoordinator& coordinator_;
      std::ostream& out_;
      std::mutex outMtx_;
      std::atomic<bool> logDirty_{ false };
    };

  } // namespace ui
} // namespace qube
