#pragma once

/** @file  MonitorCoordinator.hpp
 *  @brief Startup wiring and operator command surface of the monitor core.
 *
 *  © 2025 Qube Monitor — licensed under MIT.
 */

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/Clock.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/EventLog.hpp"
#include "core/LinkSupervisor.hpp"
#include "core/MonitorConfig.hpp"
#include "core/StatusAggregator.hpp"
#include "io/PortScanner.hpp"

namespace qube {
  namespace ui {
    class PresentationPort;
  } // namespace ui

  namespace core {

    /**
 * @class MonitorCoordinator
 * @brief Owns EventLog, ErrorMonitor, StatusAggregator and LinkSupervisor and
 *        routes their notifications to one PresentationPort.
 *
 *  * Commands mirror what a teacher can do from the front end.
 *  * The log filter lives here; EventLog itself is filter-agnostic.
 */
    class MonitorCoordinator {

    public:
      struct Dependencies {
        std::shared_ptr<Clock> clock;
        std::shared_ptr<io::PortScanner> scanner;
        LinkSupervisor::ChannelFactory channelFactory;
      };

      /// Production wiring: real clock, sysfs scanner, POSIX serial channels.
      static Dependencies defaultDependencies();

      explicit MonitorCoordinator(const MonitorConfig& config,
                                  Dependencies deps = defaultDependencies());
      ~MonitorCoordinator();

      /// Route notifications to \p port (nullptr detaches).
      void attach(std::shared_ptr<ui::PresentationPort> port);

      // ---- commands ----------------------------------------------------------
      std::vector<std::string> listPorts() const;
      bool connect(const std::string& port);
      void disconnect();
      RosterReport updateAllowList(const std::string& text);
      bool resolve(StudentId id);
      void clearStatuses();
      void setLogFilter(LogCategory category, bool enabled);
      void clearLog();
      std::string exportLog() const;
      void inject(const std::string& line);

      // ---- read-through queries ---------------------------------------------
      std::vector<StudentView> sortedView() const { return aggregator_->sortedView(); }
      std::optional<StatusDuration> durationOf(StudentId id) const {
        return aggregator_->durationOf(id);
      }
      std::vector<LogEntry> filteredLog() const;
      LogFilter logFilter() const;
      LogStats logStats() const { return log_->stats(); }
      StudentCounts counts() const { return aggregator_->counts(); }
      LinkState linkState() const { return link_->state(); }
      LinkStats linkStats() const { return link_->stats(); }
      bool isConnected() const { return link_->isConnected(); }

      const std::shared_ptr<EventLog>& eventLog() const { return log_; }
      const std::shared_ptr<ErrorMonitor>& errorMonitor() const { return errors_; }

      MonitorCoordinator(const MonitorCoordinator&) = delete;
      MonitorCoordinator& operator=(const MonitorCoordinator&) = delete;

    private:
      std::shared_ptr<ui::PresentationPort> presentation() const;

      std::shared_ptr<Clock> clock_;
      std::shared_ptr<EventLog> log_;
      std::shared_ptr<ErrorMonitor> errors_;
      std::shared_ptr<StatusAggregator> aggregator_;
      std::unique_ptr<LinkSupervisor> link_;

      mutable std::mutex mtx_;
      std::shared_ptr<ui::PresentationPort> port_{};
      LogFilter filter_{};
    };

  } // namespace core
} // namespace qube
