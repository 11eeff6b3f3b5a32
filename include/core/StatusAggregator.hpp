#pragma once
/** @file  StatusAggregator.hpp
 *  @brief Per-student status map: roster membership, de-duplication, priority view.
 *
 *  © 2025 Qube Monitor — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Qube headers
#include "core/Clock.hpp"
#include "core/MonitorConfig.hpp"
#include "protocols/StatusCodec.hpp"

namespace qube {
  namespace core {

    struct StatusRecord {
      protocols::StatusCode code{ protocols::StatusCode::Available };
      std::string text;
      Color color{ Color::Green };
      SteadyTime lastUpdate{};  ///< never decreases
      SteadyTime statusStart{}; ///< fixed while `code` is unchanged
      WallTime changedAt{};     ///< wall time of the last change, for display
    };

    enum class ApplyResult : std::uint8_t {
      NotAllowed, ///< student not on the roster, nothing stored
      Changed,    ///< new record or different code
      Duplicate,  ///< same code inside the duplicate window, discarded
      Refreshed   ///< same code after the window, lastUpdate bumped only
    };

    inline const char* toString(ApplyResult r) {
      switch (r) {
      case ApplyResult::NotAllowed:
        return "not allowed";
      case ApplyResult::Changed:
        return "changed";
      case ApplyResult::Duplicate:
        return "duplicate";
      case ApplyResult::Refreshed:
        return "refreshed";
      default:
        return "unknown";
      }
    }

    struct ApplyOutcome {
      ApplyResult result{ ApplyResult::NotAllowed };
      std::optional<StatusRecord> record; ///< set only for Changed
    };

    struct StudentView {
      StudentId id{ 0 };
      std::string name;
      StatusRecord record;
    };

    enum class DurationTier : std::uint8_t { Normal, Warning, Critical };

    inline Color colorOf(DurationTier t) {
      switch (t) {
      case DurationTier::Warning:
        return Color::Orange;
      case DurationTier::Critical:
        return Color::Red;
      default:
        return Color::Black;
      }
    }

    struct StatusDuration {
      std::chrono::seconds elapsed{ 0 };
      std::string text; ///< "42s", "3m 5s", "1h 2m"
      DurationTier tier{ DurationTier::Normal };
    };

    struct RosterIssue {
      std::string line;
      std::string reason;
    };

    struct RosterReport {
      std::size_t accepted{ 0 };
      std::vector<StudentId> removed; ///< ids whose records were dropped
      std::vector<RosterIssue> skipped;
    };

    struct StudentCounts {
      std::size_t allowed{ 0 };
      std::size_t tracked{ 0 };
    };

    /// "42s" below a minute, "3m 5s" below an hour, "1h 2m" beyond.
    std::string formatDuration(std::chrono::seconds elapsed);

    /**
 * @class StatusAggregator
 * @brief Turns decoded line events into one record per allowed student.
 *
 * * Thread-safe: one mutex serializes apply() from the read loop against
 *   roster/resolve commands from the operator surface.
 * * Every query returns a copy; nothing hands out references into the map.
 * * Records are removed only by roster replacement (or clearStatuses()).
 */
    class StatusAggregator {
    public:
      StatusAggregator(std::shared_ptr<Clock> clock, const MonitorConfig& config);
      ~StatusAggregator() = default;

      //---event path------------------------------------------------------
      ApplyOutcome apply(const protocols::DecodedEvent& event);

      //---operator commands-----------------------------------------------
      /// Replace the roster from `id` / `id:name` lines; bad lines are skipped.
      RosterReport updateAllowList(std::string_view text);

      /// Teacher ends the interaction; false if the student has no record.
      bool resolve(StudentId id);

      /// Drop every record, keep the roster; returns the ids that had one.
      std::vector<StudentId> clearStatuses();

      //---queries---------------------------------------------------------
      /// HelpNeeded, then Question (longest waiting first), then the rest by id.
      std::vector<StudentView> sortedView() const;

      /// Elapsed time in the current Question/HelpNeeded state; nullopt otherwise.
      std::optional<StatusDuration> durationOf(StudentId id) const;

      std::optional<StatusRecord> record(StudentId id) const;
      bool isAllowed(StudentId id) const;
      std::string displayName(StudentId id) const;
      std::vector<StudentId> activeStudents() const;
      StudentCounts counts() const;

    private:
      std::string nameLocked(StudentId id) const;

      std::shared_ptr<Clock> clock_;
      const std::chrono::seconds duplicateWindow_;
      const std::chrono::seconds durationWarning_;
      const std::chrono::seconds durationCritical_;

      mutable std::mutex mtx_;
      std::map<StudentId, std::string> allowed_; ///< roster: id → display name
      std::unordered_map<StudentId, StatusRecord> records_;
    };

  } // namespace core
} // namespace qube
