#pragma once
/** @file  EventLog.hpp
 *  @brief Bounded, categorized activity log (status changes, link errors, health).
 *
 *  © 2025 Qube Monitor — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Qube headers
#include "core/Clock.hpp"

namespace qube {
  namespace core {

    enum class LogCategory : std::uint8_t { Status, Error, Health, Info, Count };
    static_assert(static_cast<std::uint8_t>(LogCategory::Count) == 4,
                  "LogCategory count changed please update code that depends on it");

    inline const char* toString(LogCategory c) {
      switch (c) {
      case LogCategory::Status:
        return "STATUS";
      case LogCategory::Error:
        return "ERROR";
      case LogCategory::Health:
        return "HEALTH";
      case LogCategory::Info:
        return "INFO";
      default:
        return "UNKNOWN";
      }
    }

    /// Hex color the presentation uses for entries of category \p c.
    inline const char* colorOf(LogCategory c) {
      switch (c) {
      case LogCategory::Status:
        return "#0066CC";
      case LogCategory::Error:
        return "#CC0000";
      case LogCategory::Health:
        return "#FF6600";
      default:
        return "#000000";
      }
    }

    struct LogEntry {
      WallTime timestamp{};
      LogCategory category{ LogCategory::Info };
      std::string message;
      std::string color;
    };

    /// `[HH:MM:SS] CATEGORY: message` in local time.
    std::string formatEntry(const LogEntry& entry);

    /**
 * @class LogFilter
 * @brief One enabled flag per category; defaults show errors only.
 */
    class LogFilter {
    public:
      LogFilter() { enabled_[static_cast<std::size_t>(LogCategory::Error)] = true; }

      void set(LogCategory c, bool on) { enabled_[static_cast<std::size_t>(c)] = on; }
      bool enabled(LogCategory c) const { return enabled_[static_cast<std::size_t>(c)]; }

      static LogFilter all() {
        LogFilter f;
        f.enabled_.fill(true);
        return f;
      }

    private:
      std::array<bool, static_cast<std::size_t>(LogCategory::Count)> enabled_{};
    };

    using LogStats = std::array<std::size_t, static_cast<std::size_t>(LogCategory::Count)>;

    /**
 * @class EventLog
 * @brief Append-only sequence capped at `maxEntries`; oldest entries are evicted.
 *
 * * Thread-safe (one mutex around the entry list).
 * * `log()` never throws to the caller.
 * * The listener runs after every append/clear, outside the lock.
 */
    class EventLog {
    public:
      EventLog(std::shared_ptr<Clock> clock, std::size_t maxEntries = 1000,
               std::size_t displayEntries = 200);
      ~EventLog() = default;

      //---public API------------------------------------------------------
      void log(const std::string& message, LogCategory category = LogCategory::Info) noexcept;

      /// Entries whose category is enabled, at most `displayEntries` of the newest, oldest first.
      std::vector<LogEntry> filteredEntries(const LogFilter& filter) const;

      /// Empties the log, then records an Info entry about it.
      void clear();

      /// All retained entries as text lines, oldest first.
      std::string exportText() const;

      std::vector<LogEntry> entries() const;
      std::size_t size() const;
      LogStats stats() const;

      void setListener(std::function<void()> listener);

      /// Mirror each entry to std::clog as it is appended.
      void setConsoleEcho(bool on);

    private:
      void append(const std::string& message, LogCategory category);
      void notify();

      std::shared_ptr<Clock> clock_;
      const std::size_t maxEntries_;
      const std::size_t displayEntries_;

      mutable std::mutex mtx_;
      std::deque<LogEntry> entries_;
      bool echo_{ false };

      std::mutex listenerMtx_;
      std::function<void()> listener_{};
    };

  } // namespace core
} // namespace qube
