/* @file MonitorCoordinator.cpp
 * @brief wires log, error monitor, aggregator and link supervisor; forwards events to the front end
 *
 * © 2025 Qube Monitor — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <iostream>

// Qube headers
#include "core/MonitorCoordinator.hpp"
#include "io/SerialChannel.hpp"
#include "ui/PresentationPort.hpp"

using namespace qube::core;

MonitorCoordinator::Dependencies MonitorCoordinator::defaultDependencies() {
  Dependencies deps;
  deps.clock = std::make_shared<Clock>();
  deps.scanner = std::make_shared<io::PortScanner>();
  deps.channelFactory = [] { return std::make_unique<io::SerialChannel>(); };
  return deps;
}

MonitorCoordinator::MonitorCoordinator(const MonitorConfig& config, Dependencies deps)
    : clock_(std::move(deps.clock)) {
  assert(clock_ && "[MonitorCoordinator] clock is nullptr");

  log_ = std::make_shared<EventLog>(clock_, config.maxLogEntries, config.logDisplayEntries);
  log_->setConsoleEcho(config.echoLogToConsole);
  errors_ = std::make_shared<ErrorMonitor>(log_);
  aggregator_ = std::make_shared<StatusAggregator>(clock_, config);
  link_ = std::make_unique<LinkSupervisor>(clock_, aggregator_, log_, errors_,
                                           std::move(deps.scanner),
                                           std::move(deps.channelFactory), config);

  log_->setListener([this] {
    if (auto p = presentation())
      p->onLogUpdated();
  });
  link_->registerConnectionStatus([this](const std::string& text, Color color) {
    if (auto p = presentation())
      p->onConnectionStatus(text, color);
  });
  link_->registerStudentChanged([this](StudentId id) {
    if (auto p = presentation())
      p->onStudentStatusChanged(id);
  });
  errors_->registerEscalation([](ErrorKind kind, const std::string& message) {
    std::cerr << "[QubeMonitor] " << toString(kind) << " error: " << message << '\n';
  });

  log_->log("Qube Monitor started", LogCategory::Info);
}

MonitorCoordinator::~MonitorCoordinator() {
  // loops first: they call back into this object
  link_.reset();
  log_->setListener(nullptr);
}

void MonitorCoordinator::attach(std::shared_ptr<ui::PresentationPort> port) {
  std::lock_guard<std::mutex> lock(mtx_);
  port_ = std::move(port);
}

std::shared_ptr<qube::ui::PresentationPort> MonitorCoordinator::presentation() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return port_;
}

std::vector<std::string> MonitorCoordinator::listPorts() const {
  return link_->listAvailablePorts();
}

bool MonitorCoordinator::connect(const std::string& port) { return link_->connect(port); }

void MonitorCoordinator::disconnect() { link_->disconnect(); }

void MonitorCoordinator::inject(const std::string& line) { link_->inject(line); }

RosterReport MonitorCoordinator::updateAllowList(const std::string& text) {
  RosterReport report = aggregator_->updateAllowList(text);

  for (const auto& issue : report.skipped)
    errors_->notifyFailure(ErrorKind::Validation,
                           "roster line '" + issue.line + "' skipped: " + issue.reason);

  log_->log("Allowed students updated: " + std::to_string(report.accepted) + " on the roster, " +
                std::to_string(report.removed.size()) + " removed",
            LogCategory::Info);

  if (auto p = presentation()) {
    for (StudentId id : report.removed)
      p->onStudentStatusChanged(id);
  }
  return report;
}

bool MonitorCoordinator::resolve(StudentId id) {
  if (!aggregator_->resolve(id))
    return false;

  log_->log(aggregator_->displayName(id) + " (" + std::to_string(id) + "): resolved by teacher",
            LogCategory::Status);
  if (auto p = presentation())
    p->onStudentStatusChanged(id);
  return true;
}

void MonitorCoordinator::clearStatuses() {
  const auto removed = aggregator_->clearStatuses();
  log_->log("All student statuses cleared", LogCategory::Info);
  if (auto p = presentation()) {
    for (StudentId id : removed)
      p->onStudentStatusChanged(id);
  }
}

void MonitorCoordinator::setLogFilter(LogCategory category, bool enabled) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    filter_.set(category, enabled);
  }
  if (auto p = presentation())
    p->onLogUpdated();
}

LogFilter MonitorCoordinator::logFilter() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return filter_;
}

std::vector<LogEntry> MonitorCoordinator::filteredLog() const {
  return log_->filteredEntries(logFilter());
}

void MonitorCoordinator::clearLog() { log_->clear(); }

std::string MonitorCoordinator::exportLog() const { return log_->exportText(); }
