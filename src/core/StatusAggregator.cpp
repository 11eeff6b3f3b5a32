/* @file StatusAggregator.cpp
 * @brief applies decoded status events under roster, de-dupe and timing rules
 *
 * © 2025 Qube Monitor — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cassert>
#include <charconv>

// Qube headers
#include "core/StatusAggregator.hpp"

using namespace qube::core;
using qube::protocols::StatusCode;

namespace {

  std::string_view trim(std::string_view s) {
    const char* ws = " \t\r\n";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos)
      return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
  }

  std::string autoName(StudentId id) { return "Student " + std::to_string(id); }

  // 0 = HelpNeeded, 1 = Question, 2 = resting
  int priorityRank(StatusCode code) {
    switch (code) {
    case StatusCode::HelpNeeded:
      return 0;
    case StatusCode::Question:
      return 1;
    default:
      return 2;
    }
  }

} // namespace

std::string qube::core::formatDuration(std::chrono::seconds elapsed) {
  const long long s = std::max<long long>(0, elapsed.count());
  if (s < 60)
    return std::to_string(s) + "s";
  if (s < 3600)
    return std::to_string(s / 60) + "m " + std::to_string(s % 60) + "s";
  return std::to_string(s / 3600) + "h " + std::to_string((s % 3600) / 60) + "m";
}

StatusAggregator::StatusAggregator(std::shared_ptr<Clock> clock, const MonitorConfig& config)
    : clock_(std::move(clock)), duplicateWindow_(config.duplicateWindow),
      durationWarning_(config.durationWarning), durationCritical_(config.durationCritical) {
  assert(clock_ && "[StatusAggregator] clock is nullptr");
}

// -------------------------------------------------------------------
// StatusAggregator::apply
// Change    : no record yet, or a different (resting-equivalent) code.
// Duplicate : same code within duplicateWindow_ of lastUpdate.
// Refreshed : same code after the window; only lastUpdate moves.
// -------------------------------------------------------------------
ApplyOutcome StatusAggregator::apply(const protocols::DecodedEvent& event) {
  std::lock_guard<std::mutex> lock(mtx_);

  if (allowed_.find(event.studentId) == allowed_.end())
    return { ApplyResult::NotAllowed, std::nullopt };

  const SteadyTime now = event.receivedAt;
  auto it = records_.find(event.studentId);

  if (it != records_.end() &&
      protocols::restingEquivalent(it->second.code) == protocols::restingEquivalent(event.code)) {
    StatusRecord& rec = it->second;
    if (now - rec.lastUpdate < duplicateWindow_)
      return { ApplyResult::Duplicate, std::nullopt };
    rec.lastUpdate = std::max(rec.lastUpdate, now);
    return { ApplyResult::Refreshed, std::nullopt };
  }

  StatusRecord rec;
  rec.code = event.code;
  rec.text = protocols::displayText(event.code);
  rec.color = protocols::colorOf(event.code);
  rec.statusStart = now;
  rec.lastUpdate = it != records_.end() ? std::max(it->second.lastUpdate, now) : now;
  rec.changedAt = clock_->wallNow();

  records_[event.studentId] = rec;
  return { ApplyResult::Changed, rec };
}

RosterReport StatusAggregator::updateAllowList(std::string_view text) {
  RosterReport report;
  std::map<StudentId, std::string> next;

  std::size_t start = 0;
  while (start <= text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string_view::npos)
      end = text.size();
    const auto line = trim(text.substr(start, end - start));
    start = end + 1;

    if (line.empty())
      continue;

    std::string_view idPart = line;
    std::string_view namePart;
    if (const auto colon = line.find(':'); colon != std::string_view::npos) {
      idPart = trim(line.substr(0, colon));
      namePart = trim(line.substr(colon + 1));
    }

    long long value = 0;
    const auto* first = idPart.data();
    const auto* last = idPart.data() + idPart.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (idPart.empty() || ec != std::errc{} || ptr != last) {
      report.skipped.push_back({ std::string(line), "not a student number" });
      continue;
    }
    if (!isValidStudentId(value)) {
      report.skipped.push_back({ std::string(line), "student number must have 6 digits" });
      continue;
    }

    const auto id = static_cast<StudentId>(value);
    next[id] = namePart.empty() ? autoName(id) : std::string(namePart);
  }

  std::lock_guard<std::mutex> lock(mtx_);
  allowed_ = std::move(next);
  report.accepted = allowed_.size();

  for (auto it = records_.begin(); it != records_.end();) {
    if (allowed_.find(it->first) == allowed_.end()) {
      report.removed.push_back(it->first);
      it = records_.erase(it);
    } else {
      ++it;
    }
  }
  std::sort(report.removed.begin(), report.removed.end());
  return report;
}

bool StatusAggregator::resolve(StudentId id) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = records_.find(id);
  if (it == records_.end())
    return false;

  const SteadyTime now = clock_->now();
  StatusRecord& rec = it->second;
  if (rec.code != StatusCode::Resolved)
    rec.statusStart = now;
  rec.code = StatusCode::Resolved;
  rec.text = protocols::displayText(StatusCode::Resolved);
  rec.color = protocols::colorOf(StatusCode::Resolved);
  rec.lastUpdate = std::max(rec.lastUpdate, now);
  rec.changedAt = clock_->wallNow();
  return true;
}

std::vector<StudentId> StatusAggregator::clearStatuses() {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<StudentId> removed;
  removed.reserve(records_.size());
  for (const auto& entry : records_)
    removed.push_back(entry.first);
  records_.clear();
  return removed;
}

std::vector<StudentView> StatusAggregator::sortedView() const {
  std::vector<StudentView> view;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    view.reserve(records_.size());
    for (const auto& [id, rec] : records_)
      view.push_back({ id, nameLocked(id), rec });
  }

  std::sort(view.begin(), view.end(), [](const StudentView& a, const StudentView& b) {
    const int ra = priorityRank(a.record.code);
    const int rb = priorityRank(b.record.code);
    if (ra != rb)
      return ra < rb;
    if (ra < 2 && a.record.statusStart != b.record.statusStart)
      return a.record.statusStart < b.record.statusStart;
    return a.id < b.id;
  });
  return view;
}

std::optional<StatusDuration> StatusAggregator::durationOf(StudentId id) const {
  SteadyTime start;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = records_.find(id);
    if (it == records_.end() || !protocols::isActive(it->second.code))
      return std::nullopt;
    start = it->second.statusStart;
  }

  const auto elapsed =
      std::max(std::chrono::seconds{ 0 },
               std::chrono::duration_cast<std::chrono::seconds>(clock_->now() - start));

  StatusDuration d;
  d.elapsed = elapsed;
  d.text = formatDuration(elapsed);
  if (elapsed < durationWarning_)
    d.tier = DurationTier::Normal;
  else if (elapsed <= durationCritical_)
    d.tier = DurationTier::Warning;
  else
    d.tier = DurationTier::Critical;
  return d;
}

std::optional<StatusRecord> StatusAggregator::record(StudentId id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = records_.find(id);
  if (it == records_.end())
    return std::nullopt;
  return it->second;
}

bool StatusAggregator::isAllowed(StudentId id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return allowed_.find(id) != allowed_.end();
}

std::string StatusAggregator::nameLocked(StudentId id) const {
  auto it = allowed_.find(id);
  return it != allowed_.end() ? it->second : autoName(id);
}

std::string StatusAggregator::displayName(StudentId id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return nameLocked(id);
}

std::vector<StudentId> StatusAggregator::activeStudents() const {
  std::vector<StudentId> ids;
  std::lock_guard<std::mutex> lock(mtx_);
  for (const auto& [id, rec] : records_) {
    if (protocols::isActive(rec.code))
      ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

StudentCounts StatusAggregator::counts() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return { allowed_.size(), records_.size() };
}
