#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from the host FS.
 *
 *  © 2025 Qube Monitor — MIT-licensed.
 */

#include <string>

// nlohmann headers
#include <nlohmann/json_fwd.hpp>

namespace qube::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to the caller.
 *
 *  * No caching: every call to `load()` re-reads the file.
 *  * All schema validation lives in the calling layer (MonitorConfig::fromJson).
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

} // namespace qube::core
