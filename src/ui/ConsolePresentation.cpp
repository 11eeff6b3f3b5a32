/* @file ConsolePresentation.cpp
 * @brief terminal front end for the monitor: status table, activity log, operator commands
 *
 * © 2025 Qube Monitor — MIT-licensed.
 */

// STL headers
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>

// Qube headers
#include "core/MonitorCoordinator.hpp"
#include "io/FileLogger.hpp"
#include "ui/ConsolePresentation.hpp"

using namespace qube::ui;
using qube::core::LogCategory;

namespace {

  std::optional<LogCategory> parseCategory(const std::string& name) {
    if (name == "status")
      return LogCategory::Status;
    if (name == "error")
      return LogCategory::Error;
    if (name == "health")
      return LogCategory::Health;
    if (name == "info")
      return LogCategory::Info;
    return std::nullopt;
  }

  std::string nowStamp(const char* fmt) {
    const std::time_t t = std::time(nullptr);
    std::tm local{};
    localtime_r(&t, &local);
    char buf[32];
    std::strftime(buf, sizeof(buf), fmt, &local);
    return buf;
  }

} // namespace

ConsolePresentation::ConsolePresentation(core::MonitorCoordinator& coordinator, std::ostream& out)
    : coordinator_(coordinator), out_(out) {}

void ConsolePresentation::onConnectionStatus(const std::string& text, core::Color color) {
  std::lock_guard<std::mutex> lock(outMtx_);
  out_ << "[link] " << text << " (" << core::toString(color) << ")\n";
}

void ConsolePresentation::onStudentStatusChanged(core::StudentId id) {
  const auto view = coordinator_.sortedView();
  std::lock_guard<std::mutex> lock(outMtx_);
  for (const auto& row : view) {
    if (row.id == id) {
      out_ << "[student] " << row.name << " (" << id << "): " << row.record.text << '\n';
      return;
    }
  }
  out_ << "[student] " << id << " removed\n";
}

void ConsolePresentation::onLogUpdated() { logDirty_ = true; }

void ConsolePresentation::printHelp() {
  std::lock_guard<std::mutex> lock(outMtx_);
  out_ << "commands:\n"
       << "  ports                       list serial ports\n"
       << "  connect <port>              open the radio bridge\n"
       << "  disconnect                  close the link\n"
       << "  roster <file>               load allowed students (id or id:name per line)\n"
       << "  resolve <id>                mark a student's request as handled\n"
       << "  reset                       clear every student status, keep the roster\n"
       << "  show                        student table, most urgent first\n"
       << "  log                         activity log (filtered)\n"
       << "  filter <category> on|off    category: status, error, health, info\n"
       << "  clear                       clear the activity log\n"
       << "  export <file>               write the full log to a file\n"
       << "  sim <line>                  feed a line as if received, e.g. sim L,123456,R\n"
       << "  stats                       link and log counters\n"
       << "  quit\n";
}

void ConsolePresentation::printTable() {
  const auto view = coordinator_.sortedView();
  std::lock_guard<std::mutex> lock(outMtx_);
  if (view.empty()) {
    out_ << "(no student status yet)\n";
    return;
  }
  for (const auto& row : view) {
    out_ << std::setw(7) << row.id << "  " << std::left << std::setw(24) << row.name
         << std::setw(12) << row.record.text << std::right;
    if (auto d = coordinator_.durationOf(row.id))
      out_ << "  " << d->text << " [" << core::toString(core::colorOf(d->tier)) << ']';
    out_ << '\n';
  }
}

void ConsolePresentation::printLog() {
  const auto entries = coordinator_.filteredLog();
  logDirty_ = false;
  std::lock_guard<std::mutex> lock(outMtx_);
  for (const auto& entry : entries)
    out_ << core::formatEntry(entry) << '\n';
  if (entries.empty())
    out_ << "(no entries for the enabled categories)\n";
}

void ConsolePresentation::printStats() {
  const auto link = coordinator_.linkStats();
  const auto logStats = coordinator_.logStats();
  const auto counts = coordinator_.counts();
  std::lock_guard<std::mutex> lock(outMtx_);
  out_ << "link: " << core::toString(coordinator_.linkState()) << ", lines " << link.linesReceived
       << " (rejected " << link.linesRejected << "), changes " << link.statusChanges
       << ", reconnects " << link.reconnectAttempts << " (failed " << link.failedReconnects
       << ")\n";
  out_ << "students: " << counts.allowed << " allowed, " << counts.tracked << " tracked\n";
  out_ << "log:";
  for (std::size_t i = 0; i < logStats.size(); ++i)
    out_ << ' ' << core::toString(static_cast<LogCategory>(i)) << '=' << logStats[i];
  out_ << '\n';
}

void ConsolePresentation::loadRoster(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    std::lock_guard<std::mutex> lock(outMtx_);
    out_ << "cannot open roster file " << path << '\n';
    return;
  }
  std::stringstream text;
  text << in.rdbuf();

  const auto report = coordinator_.updateAllowList(text.str());
  std::lock_guard<std::mutex> lock(outMtx_);
  out_ << report.accepted << " students allowed, " << report.skipped.size() << " lines skipped, "
       << report.removed.size() << " records removed\n";
}

// header + rule + every retained entry, oldest first
void ConsolePresentation::exportLog(const std::string& path) {
  io::FileLogger file;
  bool ok = file.open(path);
  if (ok) {
    ok = file.write("Qube Monitor Log Export - " + nowStamp("%Y-%m-%d %H:%M:%S") + "\n") &&
         file.write(std::string(60, '=') + "\n\n") && file.write(coordinator_.exportLog());
    ok = file.close() && ok;
  }

  if (ok)
    coordinator_.eventLog()->log("Log exported to " + path, LogCategory::Info);
  else
    coordinator_.eventLog()->log("Log export to " + path + " failed", LogCategory::Error);

  std::lock_guard<std::mutex> lock(outMtx_);
  out_ << (ok ? "exported to " : "export failed: ") << path << '\n';
}

void ConsolePresentation::setFilter(const std::string& category, const std::string& state) {
  const auto cat = parseCategory(category);
  if (!cat || (state != "on" && state != "off")) {
    std::lock_guard<std::mutex> lock(outMtx_);
    out_ << "usage: filter <status|error|health|info> <on|off>\n";
    return;
  }
  coordinator_.setLogFilter(*cat, state == "on");
}

bool ConsolePresentation::execute(const std::string& commandLine) {
  std::istringstream in(commandLine);
  std::string cmd;
  in >> cmd;
  std::string arg;
  std::getline(in >> std::ws, arg);

  if (cmd.empty())
    return true;
  if (cmd == "quit" || cmd == "exit")
    return false;

  if (cmd == "help") {
    printHelp();
  } else if (cmd == "ports") {
    const auto ports = coordinator_.listPorts();
    std::lock_guard<std::mutex> lock(outMtx_);
    for (const auto& p : ports)
      out_ << p << '\n';
    if (ports.empty())
      out_ << "(no serial ports found)\n";
  } else if (cmd == "connect") {
    coordinator_.connect(arg);
  } else if (cmd == "disconnect") {
    coordinator_.disconnect();
  } else if (cmd == "roster") {
    loadRoster(arg);
  } else if (cmd == "resolve") {
    char* end = nullptr;
    const long id = std::strtol(arg.c_str(), &end, 10);
    if (arg.empty() || *end != '\0' || !core::isValidStudentId(id) ||
        !coordinator_.resolve(static_cast<core::StudentId>(id))) {
      std::lock_guard<std::mutex> lock(outMtx_);
      out_ << "no status to resolve for '" << arg << "'\n";
    }
  } else if (cmd == "reset") {
    coordinator_.clearStatuses();
  } else if (cmd == "show") {
    printTable();
  } else if (cmd == "log") {
    printLog();
  } else if (cmd == "filter") {
    std::istringstream args(arg);
    std::string category, state;
    args >> category >> state;
    setFilter(category, state);
  } else if (cmd == "clear") {
    coordinator_.clearLog();
  } else if (cmd == "export") {
    exportLog(arg);
  } else if (cmd == "sim") {
    coordinator_.inject(arg);
  } else if (cmd == "stats") {
    printStats();
  } else {
    std::lock_guard<std::mutex> lock(outMtx_);
    out_ << "unknown command '" << cmd << "', try 'help'\n";
  }
  return true;
}

void ConsolePresentation::run(std::istream& in) {
  printHelp();
  std::string line;
  while (true) {
    {
      std::lock_guard<std::mutex> lock(outMtx_);
      out_ << (logDirty_ ? "qube (log updated)> " : "qube> ") << std::flush;
    }
    if (!std::getline(in, line))
      break;
    if (!execute(line))
      break;
  }
}
