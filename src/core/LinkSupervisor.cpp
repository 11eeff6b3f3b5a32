/* @file LinkSupervisor.cpp
 * @brief serial link lifecycle, read loop and health loop for the radio bridge
 *
 * © 2025 Qube Monitor — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <iostream>
#include <string>
#include <variant>

// Qube headers
#include "core/LinkSupervisor.hpp"
#include "protocols/StatusCodec.hpp"

using namespace qube::core;

namespace {

  long long wholeSeconds(std::chrono::steady_clock::duration d) {
    return std::chrono::duration_cast<std::chrono::seconds>(d).count();
  }

} // namespace

LinkSupervisor::LinkSupervisor(std::shared_ptr<Clock> clock,
                               std::shared_ptr<StatusAggregator> aggregator,
                               std::shared_ptr<EventLog> log,
                               std::shared_ptr<ErrorMonitor> errMonitor,
                               std::shared_ptr<io::PortScanner> scanner, ChannelFactory factory,
                               const MonitorConfig& config)
    : clock_(std::move(clock)), aggregator_(std::move(aggregator)), log_(std::move(log)),
      errorMonitor_(std::move(errMonitor)), scanner_(std::move(scanner)),
      factory_(std::move(factory)), config_(config) {
  assert(clock_ && "[LinkSupervisor] clock is nullptr");
  assert(aggregator_ && "[LinkSupervisor] aggregator is nullptr");
  assert(log_ && "[LinkSupervisor] event log is nullptr");
  assert(errorMonitor_ && "[LinkSupervisor] error monitor is nullptr");
  assert(scanner_ && "[LinkSupervisor] port scanner is nullptr");
  assert(factory_ && "[LinkSupervisor] channel factory is empty");
}

LinkSupervisor::~LinkSupervisor() {
  std::lock_guard<std::mutex> lock(lifecycleMtx_);
  manualDisconnect_ = true;
  stopLoops();
  closeChannel();
  // the read loop leaves within one readTimeout once its token is cleared
  for (auto& t : stragglers_) {
    if (t.joinable())
      t.join();
  }
}

//---callbacks-----------------------------------------------------------

void LinkSupervisor::registerConnectionStatus(ConnectionStatusCallback cb) {
  std::lock_guard<std::mutex> lock(cbMtx_);
  onStatus_ = std::move(cb);
}

void LinkSupervisor::registerStudentChanged(StudentChangedCallback cb) {
  std::lock_guard<std::mutex> lock(cbMtx_);
  onStudent_ = std::move(cb);
}

void LinkSupervisor::transition(LinkState next, const std::string& text, Color color,
                                LogCategory category) {
  state_ = next;
  log_->log(std::string("Link ") + toString(next) + ": " + text, category);
  ConnectionStatusCallback cb;
  {
    std::lock_guard<std::mutex> lock(cbMtx_);
    cb = onStatus_;
  }
  if (!cb)
    return;
  try {
    cb(text, color);
  } catch (const std::exception& e) {
    std::cerr << "[LinkSupervisor] status callback failed: " << e.what() << '\n';
  }
}

void LinkSupervisor::emitStudentChanged(StudentId id) {
  StudentChangedCallback cb;
  {
    std::lock_guard<std::mutex> lock(cbMtx_);
    cb = onStudent_;
  }
  if (!cb)
    return;
  try {
    cb(id);
  } catch (const std::exception& e) {
    std::cerr << "[LinkSupervisor] student callback failed: " << e.what() << '\n';
  }
}

//---queries-------------------------------------------------------------

std::vector<std::string> LinkSupervisor::listAvailablePorts() const { return scanner_->list(); }

bool LinkSupervisor::isConnected() const {
  if (state_.load() != LinkState::Connected)
    return false;
  auto ch = currentChannel();
  return ch && ch->isOpen();
}

std::string LinkSupervisor::selectedPort() const {
  std::lock_guard<std::mutex> lock(linkMtx_);
  return port_;
}

LinkStats LinkSupervisor::stats() const {
  LinkStats s;
  s.linesReceived = linesReceived_.load();
  s.linesRejected = linesRejected_.load();
  s.statusChanges = statusChanges_.load();
  s.reconnectAttempts = reconnectAttempts_.load();
  s.failedReconnects = failedReconnects_.load();
  return s;
}

std::shared_ptr<qube::io::SerialChannel> LinkSupervisor::currentChannel() const {
  std::lock_guard<std::mutex> lock(linkMtx_);
  return channel_;
}

//---lifecycle-----------------------------------------------------------

std::shared_ptr<qube::io::SerialChannel> LinkSupervisor::openChannel(const std::string& port,
                                                                     std::string& error) {
  const auto speed = io::toSpeed(config_.baud);
  if (!speed) {
    error = "unsupported baud rate " + std::to_string(config_.baud);
    return nullptr;
  }

  std::unique_ptr<io::SerialChannel> ch = factory_();
  if (!ch) {
    error = "no serial channel available";
    return nullptr;
  }
  if (!ch->open(port, *speed)) {
    error = ch->lastError().empty() ? "open failed" : ch->lastError();
    return nullptr;
  }
  return std::shared_ptr<io::SerialChannel>(std::move(ch));
}

void LinkSupervisor::resetTimers(SteadyTime now) {
  std::lock_guard<std::mutex> lock(linkMtx_);
  lastHeartbeat_ = now;
  lastReconnect_ = now;
  lastSelfTest_ = now;
}

void LinkSupervisor::closeChannel() {
  std::shared_ptr<io::SerialChannel> old;
  {
    std::lock_guard<std::mutex> lock(linkMtx_);
    old = std::move(channel_);
    channel_.reset();
  }
  if (old)
    old->close();
}

bool LinkSupervisor::connect(const std::string& port) {
  std::lock_guard<std::mutex> lock(lifecycleMtx_);

  if (port.empty()) {
    errorMonitor_->notifyFailure(ErrorKind::Configuration, "connect requested without a port");
    transition(LinkState::Disconnected, "No port selected", Color::Red);
    return false;
  }

  // drop any previous session first
  stopLoops();
  closeChannel();

  {
    std::lock_guard<std::mutex> linkLock(linkMtx_);
    port_ = port;
  }
  transition(LinkState::Connecting, "Connecting to " + port, Color::Orange);

  std::string error;
  auto ch = openChannel(port, error);
  if (!ch) {
    manualDisconnect_ = true;
    errorMonitor_->notifyFailure(ErrorKind::Transport,
                                 "connection to " + port + " failed: " + error);
    transition(LinkState::Disconnected, "Connection failed: " + error, Color::Red);
    return false;
  }

  {
    std::lock_guard<std::mutex> linkLock(linkMtx_);
    channel_ = std::move(ch);
  }
  resetTimers(clock_->now());
  reconnectRequested_ = false;
  manualDisconnect_ = false;
  errorMonitor_->clearSeen();

  startLoops();
  transition(LinkState::Connected, "Connected", Color::Green);
  return true;
}

void LinkSupervisor::disconnect() {
  std::lock_guard<std::mutex> lock(lifecycleMtx_);
  manualDisconnect_ = true;
  stopLoops();
  closeChannel(); // a loop that missed the timeout fails its next I/O and exits

  transition(LinkState::Disconnected, "Not connected", Color::Gray);
}

void LinkSupervisor::startLoops() {
  runToken_ = std::make_shared<std::atomic<bool>>(true);

  std::promise<void> readerDone;
  readerDone_ = readerDone.get_future();
  reader_ = std::thread([this, token = runToken_, done = std::move(readerDone)]() mutable {
    readLoop(token);
    done.set_value();
  });

  std::promise<void> healthDone;
  healthDone_ = healthDone.get_future();
  health_ = std::thread([this, token = runToken_, done = std::move(healthDone)]() mutable {
    healthLoop(token);
    done.set_value();
  });
}

void LinkSupervisor::stopLoops() {
  if (!runToken_)
    return;
  {
    std::lock_guard<std::mutex> lock(wakeMtx_);
    *runToken_ = false;
  }
  wakeCv_.notify_all();

  const auto deadline = std::chrono::steady_clock::now() + config_.shutdownTimeout;
  retire(reader_, readerDone_, deadline);
  retire(health_, healthDone_, deadline);
  runToken_.reset();
}

void LinkSupervisor::retire(std::thread& worker, std::future<void>& done,
                            std::chrono::steady_clock::time_point deadline) {
  if (!worker.joinable())
    return;
  if (done.valid() && done.wait_until(deadline) == std::future_status::ready) {
    worker.join();
    return;
  }
  // keep the handle; joined in the destructor
  std::cerr << "[LinkSupervisor] loop did not stop within "
            << config_.shutdownTimeout.count() << " ms\n";
  stragglers_.push_back(std::move(worker));
}

//---read loop-----------------------------------------------------------

void LinkSupervisor::requestReconnect() {
  {
    std::lock_guard<std::mutex> lock(wakeMtx_);
    reconnectRequested_ = true;
  }
  wakeCv_.notify_all();
}

void LinkSupervisor::readLoop(RunToken token) {
  while (*token) {
    try {
      auto ch = currentChannel();
      if (!ch || !ch->isOpen()) {
        // waiting for the health loop to bring the link back
        std::unique_lock<std::mutex> lock(wakeMtx_);
        wakeCv_.wait_for(lock, config_.readTimeout, [&] { return !*token; });
        continue;
      }

      auto line = ch->readLine(config_.readTimeout);
      if (line) {
        handleLine(*line, clock_->now());
        continue;
      }

      // a closed handle that is still the current one means a device fault
      if (!ch->isOpen() && *token && ch == currentChannel()) {
        errorMonitor_->notifyFailure(ErrorKind::Transport,
                                     "read from " + selectedPort() + " failed: " + ch->lastError());
        requestReconnect();
      }
    } catch (const std::exception& e) {
      errorMonitor_->notifyFailure(ErrorKind::Transport, std::string("read loop: ") + e.what());
      std::unique_lock<std::mutex> lock(wakeMtx_);
      wakeCv_.wait_for(lock, config_.readTimeout, [&] { return !*token; });
    }
  }
}

void LinkSupervisor::inject(const std::string& rawLine) {
  try {
    handleLine(rawLine, clock_->now());
  } catch (const std::exception& e) {
    errorMonitor_->notifyFailure(ErrorKind::Protocol, std::string("injected line: ") + e.what());
  }
}

// -------------------------------------------------------------------
// LinkSupervisor::handleLine
// Any line, valid or not, is a heartbeat. Rejected lines are logged
// and dropped; accepted events go to the aggregator in arrival order.
// -------------------------------------------------------------------
void LinkSupervisor::handleLine(const std::string& raw, SteadyTime receivedAt) {
  std::lock_guard<std::mutex> order(lineMtx_);

  {
    std::lock_guard<std::mutex> lock(linkMtx_);
    if (receivedAt > lastHeartbeat_)
      lastHeartbeat_ = receivedAt;
  }
  ++linesReceived_;

  const std::string text = protocols::sanitizeUtf8(raw);
  const auto decoded = protocols::StatusCodec::decode(text, receivedAt);

  if (const auto* rejection = std::get_if<protocols::Rejection>(&decoded)) {
    ++linesRejected_;
    errorMonitor_->notifyFailure(ErrorKind::Protocol,
                                 "rejected line '" + text + "': " + toString(rejection->reason) +
                                     " (" + rejection->detail + ")");
    return;
  }

  const auto& event = std::get<protocols::DecodedEvent>(decoded);
  const auto outcome = aggregator_->apply(event);

  switch (outcome.result) {
  case ApplyResult::NotAllowed:
    log_->log("Student " + std::to_string(event.studentId) + " not in allowed list, ignored",
              LogCategory::Info);
    break;
  case ApplyResult::Changed:
    ++statusChanges_;
    log_->log(aggregator_->displayName(event.studentId) + " (" +
                  std::to_string(event.studentId) + "): " + outcome.record->text,
              LogCategory::Status);
    emitStudentChanged(event.studentId);
    break;
  case ApplyResult::Duplicate:
  case ApplyResult::Refreshed:
    break;
  }
}

//---health loop---------------------------------------------------------

void LinkSupervisor::healthLoop(RunToken token) {
  while (*token) {
    {
      std::unique_lock<std::mutex> lock(wakeMtx_);
      wakeCv_.wait_for(lock, config_.healthCheckInterval,
                       [&] { return !*token || reconnectRequested_.load(); });
    }
    if (!*token)
      break;

    try {
      checkHealth();
    } catch (const std::exception& e) {
      errorMonitor_->notifyFailure(ErrorKind::Transport, std::string("health check: ") + e.what());
    }
  }
}

bool LinkSupervisor::selfTest(io::SerialChannel& channel, const std::string& port) {
  if (!scanner_->contains(port)) {
    log_->log("Self-test: " + port + " is no longer listed by the host", LogCategory::Health);
    return false;
  }
  if (!channel.writeLine(config_.probeLine)) {
    log_->log("Self-test: probe write to " + port + " failed: " + channel.lastError(),
              LogCategory::Health);
    return false;
  }
  return true;
}

// -------------------------------------------------------------------
// LinkSupervisor::checkHealth
// Checked in order, the first hit reconnects:
//   read fault → forced refresh → handle not open → self-test → silence
// -------------------------------------------------------------------
void LinkSupervisor::checkHealth() {
  if (manualDisconnect_)
    return;

  // connect()/disconnect() in progress: they own the link this tick
  std::unique_lock<std::mutex> lifecycle(lifecycleMtx_, std::try_to_lock);
  if (!lifecycle.owns_lock() || manualDisconnect_)
    return;

  const std::string port = selectedPort();
  if (port.empty())
    return;

  const SteadyTime now = clock_->now();
  SteadyTime lastReconnect, lastSelfTest, lastHeartbeat;
  {
    std::lock_guard<std::mutex> lock(linkMtx_);
    lastReconnect = lastReconnect_;
    lastSelfTest = lastSelfTest_;
    lastHeartbeat = lastHeartbeat_;
  }

  if (reconnectRequested_.exchange(false)) {
    reconnectLocked("read failure");
    return;
  }

  if (config_.forcedRefreshInterval.count() > 0 &&
      now - lastReconnect > config_.forcedRefreshInterval) {
    reconnectLocked("scheduled refresh");
    return;
  }

  auto ch = currentChannel();
  if (!ch || !ch->isOpen()) {
    reconnectLocked("link not open");
    return;
  }

  if (now - lastSelfTest > config_.selfTestInterval) {
    if (!selfTest(*ch, port)) {
      reconnectLocked("self-test failed");
      return;
    }
    {
      std::lock_guard<std::mutex> lock(linkMtx_);
      lastSelfTest_ = now;
    }
    log_->log("Self-test passed on " + port, LogCategory::Health);
  }

  const auto silence = now - lastHeartbeat;
  if (silence > config_.heartbeatReconnect) {
    reconnectLocked("no data for " + std::to_string(wholeSeconds(silence)) + " s");
    return;
  }
  if (silence > config_.heartbeatWarning) {
    log_->log("Heartbeat warning: " + std::to_string(wholeSeconds(silence)) +
                  " s since last message",
              LogCategory::Health);
  }
}

bool LinkSupervisor::reconnectLocked(const std::string& reason) {
  const std::string port = selectedPort();
  ++reconnectAttempts_;

  transition(LinkState::Reconnecting, "Reconnecting", Color::Orange, LogCategory::Health);
  log_->log("Reconnecting to " + port + " (" + reason + ")", LogCategory::Health);

  closeChannel();

  std::string error;
  auto ch = openChannel(port, error);
  if (!ch) {
    ++failedReconnects_;
    errorMonitor_->notifyFailure(ErrorKind::Transport,
                                 "reconnect to " + port + " failed: " + error);
    transition(LinkState::Disconnected, "Reconnect failed", Color::Red, LogCategory::Health);
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(linkMtx_);
    channel_ = std::move(ch);
  }
  resetTimers(clock_->now());
  errorMonitor_->clearSeen();

  transition(LinkState::Connected, "Reconnected to " + port, Color::Green, LogCategory::Health);
  return true;
}
