/* @file EventLog.cpp
 * @brief bounded activity log with category filtering and text export
 *
 * © 2025 Qube Monitor — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <ctime>
#include <iostream>
#include <sstream>

// Qube headers
#include "core/EventLog.hpp"

using namespace qube::core;

std::string qube::core::formatEntry(const LogEntry& entry) {
  const std::time_t t = std::chrono::system_clock::to_time_t(entry.timestamp);
  std::tm local{};
  localtime_r(&t, &local);

  char stamp[16];
  std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &local);

  return std::string("[") + stamp + "] " + toString(entry.category) + ": " + entry.message;
}

EventLog::EventLog(std::shared_ptr<Clock> clock, std::size_t maxEntries, std::size_t displayEntries)
    : clock_(std::move(clock)), maxEntries_(maxEntries), displayEntries_(displayEntries) {
  assert(clock_ && "[EventLog] clock is nullptr");
  assert(maxEntries_ > 0 && "[EventLog] capacity must be positive");
}

void EventLog::append(const std::string& message, LogCategory category) {
  LogEntry entry{ clock_->wallNow(), category, message, colorOf(category) };

  std::lock_guard<std::mutex> lock(mtx_);
  if (echo_)
    std::clog << formatEntry(entry) << '\n';
  entries_.push_back(std::move(entry));
  while (entries_.size() > maxEntries_)
    entries_.pop_front();
}

void EventLog::log(const std::string& message, LogCategory category) noexcept {
  try {
    append(message, category);
  } catch (const std::exception& e) {
    // bad_alloc or a throwing clock; the caller must not see it
    std::cerr << "[EventLog] dropped entry: " << e.what() << '\n';
    return;
  }
  notify();
}

void EventLog::notify() {
  std::function<void()> listener;
  {
    std::lock_guard<std::mutex> lock(listenerMtx_);
    listener = listener_;
  }
  if (!listener)
    return;
  try {
    listener();
  } catch (const std::exception& e) {
    std::cerr << "[EventLog] listener failed: " << e.what() << '\n';
  }
}

std::vector<LogEntry> EventLog::filteredEntries(const LogFilter& filter) const {
  std::vector<LogEntry> out;
  std::lock_guard<std::mutex> lock(mtx_);

  // walk backwards to collect the newest matches, then restore chronological order
  for (auto it = entries_.rbegin(); it != entries_.rend() && out.size() < displayEntries_; ++it) {
    if (filter.enabled(it->category))
      out.push_back(*it);
  }
  return std::vector<LogEntry>(out.rbegin(), out.rend());
}

void EventLog::clear() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    entries_.clear();
  }
  log("Activity log cleared", LogCategory::Info);
}

std::string EventLog::exportText() const {
  std::ostringstream out;
  std::lock_guard<std::mutex> lock(mtx_);
  for (const auto& entry : entries_)
    out << formatEntry(entry) << '\n';
  return out.str();
}

std::vector<LogEntry> EventLog::entries() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return std::vector<LogEntry>(entries_.begin(), entries_.end());
}

std::size_t EventLog::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return entries_.size();
}

LogStats EventLog::stats() const {
  LogStats counts{};
  std::lock_guard<std::mutex> lock(mtx_);
  for (const auto& entry : entries_)
    ++counts[static_cast<std::size_t>(entry.category)];
  return counts;
}

void EventLog::setListener(std::function<void()> listener) {
  std::lock_guard<std::mutex> lock(listenerMtx_);
  listener_ = std::move(listener);
}

void EventLog::setConsoleEcho(bool on) {
  std::lock_guard<std::mutex> lock(mtx_);
  echo_ = on;
}
