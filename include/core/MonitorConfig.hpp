#pragma once
/** @file  MonitorConfig.hpp
 *  @brief Typed run-time settings for link supervision, aggregation and logging.
 *
 *  © 2025 Qube Monitor — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <string>

// nlohmann headers
#include <nlohmann/json_fwd.hpp>

namespace qube::core {

  /**
 * @struct MonitorConfig
 * @brief Every tunable constant of the monitor, defaults match a classroom setup.
 *
 *  * `forcedRefreshInterval == 0` disables the unconditional reconnect.
 *  * Schema validation lives in `fromJson()`; ConfigLoader only parses.
 */
  struct MonitorConfig {
    //---serial link----------------------------------------------------
    int baud{ 115200 };
    std::chrono::milliseconds readTimeout{ 200 };
    std::string probeLine{ "HEALTH_CHECK" };

    //---health loop----------------------------------------------------
    std::chrono::seconds healthCheckInterval{ 10 };
    std::chrono::seconds forcedRefreshInterval{ 180 };
    std::chrono::seconds selfTestInterval{ 60 };
    std::chrono::seconds heartbeatWarning{ 40 };
    std::chrono::seconds heartbeatReconnect{ 90 };
    std::chrono::milliseconds shutdownTimeout{ 2000 };

    //---student aggregation--------------------------------------------
    std::chrono::seconds duplicateWindow{ 5 };
    std::chrono::seconds durationWarning{ 120 };
    std::chrono::seconds durationCritical{ 300 };

    //---event log------------------------------------------------------
    std::size_t maxLogEntries{ 1000 };
    std::size_t logDisplayEntries{ 200 };
    bool echoLogToConsole{ false };

    /// Overlay \p doc onto the defaults; throws `std::runtime_error` naming the bad key.
    static MonitorConfig fromJson(const nlohmann::json& doc);
  };

} // namespace qube::core
