#pragma once
/** @file  SerialChannel.hpp
 *  @brief Non-blocking UART line I/O wrapper (uses poll/termios under the hood).
 *
 *  © 2025 Qube Monitor — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

// Linux header
#include <termios.h> // for speed_t types e.g., B115200

namespace qube {
  namespace io {

    /// Maps a numeric baud rate onto its termios constant; std::nullopt if unsupported.
    std::optional<speed_t> toSpeed(int baud);

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a single /dev/tty* file descriptor.
 *
 *  * Frames input as `\n`-terminated lines (a trailing `\r` is dropped),
 *    output as `\r\n`-terminated lines.
 *  * A hang-up or hard I/O error closes the descriptor, so `isOpen()` is the
 *    fault indicator after `readLine()` / `writeLine()` report failure.
 *  * `close()` may be called from another thread while `readLine()` is waiting:
 *    the wait is woken through an eventfd and the descriptor is released only
 *    after the last reader/writer has left, so its number cannot be reused
 *    under a blocked `poll()`.
 *  * *Non-copyable*, non-movable (shared between the read and health loops).
 */

    class SerialChannel {

    public:
      //---ctr / dtr--------------------------------------------
      SerialChannel() = default;
      virtual ~SerialChannel(); // close the /dev/tty fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& dev, speed_t baud);
      virtual bool writeLine(const std::string& line); // returns false on EIO
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      virtual bool isOpen() const { return fd_.load() >= 0; }
      virtual void close();

      /// Reason of the most recent failure ("" if none yet).
      std::string lastError() const;

      static constexpr std::size_t kMaxPartialLine = 4096;

      //---non-copyable, non-movable------------------------------
      SerialChannel(const SerialChannel&) = delete;
      SerialChannel& operator=(const SerialChannel&) = delete;

    protected:
      void setError(std::string reason);

    private:
      std::optional<std::string> takeLine();

      int acquire(int* wakeFd = nullptr); ///< -1 if closed, else fd pinned until release()
      void release();
      void releaseFdsLocked();

      std::atomic<int> fd_{ -1 }; ///< published fd (-1 == closed or closing)
      std::string rx_buffer_{};   ///< buffer to store readLine content

      std::mutex fdMtx_;
      int ownedFd_{ -1 };  ///< the descriptor actually held open
      int wakeFd_{ -1 };   ///< eventfd signalled by close()
      int users_{ 0 };     ///< readLine/writeLine calls currently using ownedFd_
      bool closePending_{ false };
      mutable std::mutex errMtx_;
      std::string lastError_{};
    };
  } // namespace io
} // namespace qube
