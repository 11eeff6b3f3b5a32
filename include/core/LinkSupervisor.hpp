#pragma once
/** @file  LinkSupervisor.hpp
 *  @brief Keeps the serial link to the radio bridge alive and feeds its lines to the aggregator.
 *
 *  © 2025 Qube Monitor — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Qube headers
#include "core/Clock.hpp"
#include "core/ErrorMonitor.hpp" // LinkSupervisor is a client to the error monitor
#include "core/EventLog.hpp"
#include "core/MonitorConfig.hpp"
#include "core/StatusAggregator.hpp"
#include "io/PortScanner.hpp"
#include "io/SerialChannel.hpp" // LinkSupervisor owns the SerialChannel and requires full type knowledge

namespace qube {
  namespace core {

    enum class LinkState : std::uint8_t { Disconnected, Connecting, Connected, Reconnecting, Count };
    static_assert(static_cast<std::uint8_t>(LinkState::Count) == 4,
                  "LinkState count changed please update code that depends on it");

    inline const char* toString(LinkState s) {
      switch (s) {
      case LinkState::Disconnected:
        return "Disconnected";
      case LinkState::Connecting:
        return "Connecting";
      case LinkState::Connected:
        return "Connected";
      case LinkState::Reconnecting:
        return "Reconnecting";
      default:
        return "Unknown";
      }
    }

    struct LinkStats {
      std::size_t linesReceived{ 0 };
      std::size_t linesRejected{ 0 };
      std::size_t statusChanges{ 0 };
      std::size_t reconnectAttempts{ 0 };
      std::size_t failedReconnects{ 0 };
    };

    /**
 * @class LinkSupervisor
 * @brief Owns the one connection handle plus the read loop and the health loop.
 *
 *  * Disconnected → Connecting → Connected|Disconnected on `connect()`.
 *  * The health loop moves Connected → Reconnecting → Connected|Disconnected on:
 *    forced refresh, handle not open, failed self-test, heartbeat silence,
 *    or a read fault reported by the read loop. A failed reconnect is retried
 *    on the next tick until `disconnect()`.
 *  * No I/O failure leaves this class as an exception; all of them end up in the
 *    ErrorMonitor and as a state transition.
 *  * Callbacks run on the calling thread (read loop, health loop or operator)
 *    and must return quickly.
 */
    class LinkSupervisor {
    public:
      using ChannelFactory = std::function<std::unique_ptr<io::SerialChannel>()>;
      using ConnectionStatusCallback = std::function<void(const std::string&, Color)>;
      using StudentChangedCallback = std::function<void(StudentId)>;

      LinkSupervisor(std::shared_ptr<Clock> clock, std::shared_ptr<StatusAggregator> aggregator,
                     std::shared_ptr<EventLog> log, std::shared_ptr<ErrorMonitor> errMonitor,
                     std::shared_ptr<io::PortScanner> scanner, ChannelFactory factory,
                     const MonitorConfig& config);
      ~LinkSupervisor(); ///< stops and joins both loops, closes the handle

      //---public APIs------------------------------------------------------
      bool connect(const std::string& port); ///<- opens the port, starts both loops
      void disconnect();                     ///<- manual stop; suppresses auto-reconnect
      std::vector<std::string> listAvailablePorts() const;
      bool isConnected() const;

      /// Feed one line as if it had arrived on the link (simulator / tests).
      void inject(const std::string& rawLine);

      /// One health-loop tick; the loop calls this every `healthCheckInterval`.
      void checkHealth();

      LinkState state() const { return state_.load(); }
      std::string selectedPort() const;
      LinkStats stats() const;

      void registerConnectionStatus(ConnectionStatusCallback cb);
      void registerStudentChanged(StudentChangedCallback cb);

      //---non-copyable-----------------------------------------------------
      LinkSupervisor(const LinkSupervisor&) = delete;
      LinkSupervisor& operator=(const LinkSupervisor&) = delete;

    private:
      using RunToken = std::shared_ptr<std::atomic<bool>>;

      void readLoop(RunToken token);
      void healthLoop(RunToken token);
      void handleLine(const std::string& raw, SteadyTime receivedAt);

      std::shared_ptr<io::SerialChannel> openChannel(const std::string& port, std::string& error);
      bool reconnectLocked(const std::string& reason);
      bool selfTest(io::SerialChannel& channel, const std::string& port);
      void requestReconnect();

      void startLoops();
      void stopLoops();
      void retire(std::thread& worker, std::future<void>& done,
                  std::chrono::steady_clock::time_point deadline);
      void closeChannel();
      void resetTimers(SteadyTime now);

      void transition(LinkState next, const std::string& text, Color color,
                      LogCategory category = LogCategory::Info);
      void emitStudentChanged(StudentId id);
      std::shared_ptr<io::SerialChannel> currentChannel() const;

      //---collaborators----------------------------------------------------
      std::shared_ptr<Clock> clock_;
      std::shared_ptr<StatusAggregator> aggregator_;
      std::shared_ptr<EventLog> log_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<io::PortScanner> scanner_;
      ChannelFactory factory_;
      const MonitorConfig config_;

      //---link state-------------------------------------------------------
      std::mutex lifecycleMtx_;   ///< serializes connect / disconnect / reconnect
      mutable std::mutex linkMtx_; ///< guards channel_, port_ and the timers
      std::shared_ptr<io::SerialChannel> channel_{};
      std::string port_{};
      SteadyTime lastHeartbeat_{};
      SteadyTime lastReconnect_{};
      SteadyTime lastSelfTest_{};

      std::atomic<LinkState> state_{ LinkState::Disconnected };
      std::atomic<bool> manualDisconnect_{ true };
      std::atomic<bool> reconnectRequested_{ false };

      //---loops------------------------------------------------------------
      std::mutex wakeMtx_;
      std::condition_variable wakeCv_;
      RunToken runToken_{};
      std::thread reader_;
      std::thread health_;
      std::future<void> readerDone_;
      std::future<void> healthDone_;
      std::vector<std::thread> stragglers_; ///< loops that missed the shutdown timeout

      std::mutex lineMtx_; ///< keeps read-loop and injected lines strictly ordered

      //---stats------------------------------------------------------------
      std::atomic<std::size_t> linesReceived_{ 0 };
      std::atomic<std::size_t> linesRejected_{ 0 };
      std::atomic<std::size_t> statusChanges_{ 0 };
      std::atomic<std::size_t> reconnectAttempts_{ 0 };
      std::atomic<std::size_t> failedReconnects_{ 0 };

      //---callbacks--------------------------------------------------------
      std::mutex cbMtx_;
      ConnectionStatusCallback onStatus_{};
      StudentChangedCallback onStudent_{};
    };

  } // namespace core
} // namespace qube
