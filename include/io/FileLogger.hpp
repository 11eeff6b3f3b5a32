#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered text writer for exported activity logs.
 *
 *  © 2025 Qube Monitor — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace qube {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Intended for exported activity logs (a few kB up to ~100 kB).
 *  * Uses `std::fwrite` in 4 kB chunks.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kChunk = 4096;

      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable (truncates existing). */
      bool open(const std::string& path);

      /** Queues text (caller includes trailing '\n'); flushes whole chunks. */
      bool write(const std::string& text);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      /** Flush + fclose; returns false if the final flush or fclose failed. */
      bool close();

      bool isOpen() const { return fp_ != nullptr; }

      /// Bytes queued but not yet handed to stdio.
      std::size_t pending() const { return buffer_.size(); }

      //---non-copyable-----------------------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;

    private:
      FILE* fp_{ nullptr };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace qube
