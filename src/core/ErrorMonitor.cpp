/* @file ErrorMonitor.cpp
 * @brief classifies, logs and de-duplicates failures reported by the link and the roster parser
 *
 * © 2025 Qube Monitor — MIT-licensed.
 */

#include <iostream>

#include "core/ErrorMonitor.hpp"
#include "core/EventLog.hpp"

namespace qube {
  namespace core {

    ErrorMonitor::ErrorMonitor(std::shared_ptr<EventLog> log) : log_(std::move(log)) {}

    void ErrorMonitor::registerEscalation(std::function<void(ErrorKind, const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    bool ErrorMonitor::markIfNew(const std::string& key) {
      if (!seen_.insert(key).second)
        return false;
      seenOrder_.push_back(key);
      if (seenOrder_.size() > kMaxSeen) {
        seen_.erase(seenOrder_.front());
        seenOrder_.pop_front();
      }
      return true;
    }

    void ErrorMonitor::notifyFailure(ErrorKind kind, const std::string& message) {
      if (log_)
        log_->log(std::string(toString(kind)) + " error: " + message, LogCategory::Error);

      std::function<void(ErrorKind, const std::string&)> escalate;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        ++counts_[static_cast<std::size_t>(kind)];
        if (escalation_ && markIfNew(std::string(toString(kind)) + '|' + message))
          escalate = escalation_;
      }

      if (!escalate)
        return;
      try {
        escalate(kind, message);
      } catch (const std::exception& e) {
        std::cerr << "[ErrorMonitor] escalation failed: " << e.what() << '\n';
      }
    }

    void ErrorMonitor::clearSeen() {
      std::lock_guard<std::mutex> lock(mtx_);
      seen_.clear();
      seenOrder_.clear();
    }

    std::size_t ErrorMonitor::seenCount() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_.size();
    }

    std::size_t ErrorMonitor::count(ErrorKind kind) const {
      std::lock_guard<std::mutex> lock(mtx_);
      return counts_[static_cast<std::size_t>(kind)];
    }

  } // namespace core
} // namespace qube
