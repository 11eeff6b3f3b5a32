#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Qube Monitor — MIT-licensed.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace qube::core {

  class EventLog;

  /// Every failure the core can observe is one of these; none is fatal.
  enum class ErrorKind : std::uint8_t { Transport, Protocol, Validation, Configuration, Count };

  inline const char* toString(ErrorKind k) {
    switch (k) {
    case ErrorKind::Transport:
      return "Transport";
    case ErrorKind::Protocol:
      return "Protocol";
    case ErrorKind::Validation:
      return "Validation";
    case ErrorKind::Configuration:
      return "Configuration";
    default:
      return "Unknown";
    }
  }

  /**
 * @class ErrorMonitor
 * @brief Subsystems call `notifyFailure()`; every failure becomes an Error log
 *        entry, and the registered escalation callback fires once per unique error.
 *
 * * Thread-safe (mutex-protected de-dupe set and counters).
 * * Debounces duplicate failures so the operator surface doesn’t get spammed;
 *   `clearSeen()` re-arms escalation (called after a link recovers).
 * * Remembers at most `kMaxSeen` distinct failures; the oldest is forgotten first.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    explicit ErrorMonitor(std::shared_ptr<EventLog> log);
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fault to the operator surface.
    void registerEscalation(std::function<void(ErrorKind, const std::string&)> cb);

    /// Called by subsystems on fault; logs, counts, and escalates if new.
    virtual void notifyFailure(ErrorKind kind, const std::string& message);

    /// Forget escalated messages so the next occurrence escalates again.
    void clearSeen();

    std::size_t count(ErrorKind kind) const;

    /// Number of distinct failures currently remembered for de-dupe.
    std::size_t seenCount() const;

    static constexpr std::size_t kMaxSeen = 256;

  private:
    bool markIfNew(const std::string& key);

    std::shared_ptr<EventLog> log_{};
    std::function<void(ErrorKind, const std::string&)> escalation_{};
    std::unordered_set<std::string> seen_; ///< de-dupe list
    std::deque<std::string> seenOrder_;    ///< insertion order of seen_
    std::array<std::size_t, static_cast<std::size_t>(ErrorKind::Count)> counts_{};
    mutable std::mutex mtx_;
  };

} // namespace qube::core
