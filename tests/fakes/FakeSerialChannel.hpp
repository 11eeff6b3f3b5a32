#pragma once
/** @file  FakeSerialChannel.hpp
 *  @brief SerialChannel derivative with scripted input and controllable failures for link testing.
 *
 *  © 2025 Qube Monitor — MIT-licensed.
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "core/LinkSupervisor.hpp"
#include "io/SerialChannel.hpp"

namespace qube {
  namespace test {

    /**
 * @struct FakeSerialScript
 * @brief State shared by every FakeSerialChannel a factory hands out.
 *
 * * Lines in `pending` are delivered to whichever channel reads next.
 * * `fault` makes the next read close the channel, like a pulled USB cable.
 * * `read_stall` makes every read block that long, ignoring its timeout and close().
 */
    struct FakeSerialScript {
      std::mutex mtx;
      bool open_succeeds = true;
      bool write_succeeds = true;
      bool fault = false;
      std::chrono::milliseconds read_stall{ 0 };
      int open_calls = 0;
      std::vector<std::string> opened_ports;
      std::vector<std::string> written;
      std::deque<std::string> pending;

      void push(const std::string& line) {
        std::lock_guard<std::mutex> lock(mtx);
        pending.push_back(line);
      }

      void setOpenSucceeds(bool ok) {
        std::lock_guard<std::mutex> lock(mtx);
        open_succeeds = ok;
      }

      void setWriteSucceeds(bool ok) {
        std::lock_guard<std::mutex> lock(mtx);
        write_succeeds = ok;
      }

      void setReadStall(std::chrono::milliseconds stall) {
        std::lock_guard<std::mutex> lock(mtx);
        read_stall = stall;
      }

      void raiseFault() {
        std::lock_guard<std::mutex> lock(mtx);
        fault = true;
      }

      int openCalls() {
        std::lock_guard<std::mutex> lock(mtx);
        return open_calls;
      }

      std::vector<std::string> writtenLines() {
        std::lock_guard<std::mutex> lock(mtx);
        return written;
      }
    };

    /**
 * @class FakeSerialChannel
 * @brief No file descriptor; every call is answered from the shared script.
 */
    class FakeSerialChannel : public qube::io::SerialChannel {
    public:
      explicit FakeSerialChannel(std::shared_ptr<FakeSerialScript> script)
          : script_(std::move(script)) {}

      bool open(const std::string& dev, speed_t) override {
        std::lock_guard<std::mutex> lock(script_->mtx);
        ++script_->open_calls;
        script_->opened_ports.push_back(dev);
        if (!script_->open_succeeds) {
          setError("Error 2 from open: No such file or directory");
          return false;
        }
        open_ = true;
        return true;
      }

      bool writeLine(const std::string& line) override {
        std::lock_guard<std::mutex> lock(script_->mtx);
        if (!open_ || !script_->write_succeeds) {
          setError("Error 5 from write: Input/output error");
          return false;
        }
        script_->written.push_back(line);
        return true;
      }

      std::optional<std::string> readLine(std::chrono::milliseconds timeout) override {
        std::chrono::milliseconds stall{ 0 };
        {
          std::lock_guard<std::mutex> lock(script_->mtx);
          stall = script_->read_stall;
        }
        if (stall.count() > 0) {
          std::this_thread::sleep_for(stall);
          return std::nullopt;
        }
        {
          std::lock_guard<std::mutex> lock(script_->mtx);
          if (!open_)
            return std::nullopt;
          if (script_->fault) {
            script_->fault = false;
            open_ = false;
            setError("Error 5 from read: Input/output error");
            return std::nullopt;
          }
          if (!script_->pending.empty()) {
            std::string line = std::move(script_->pending.front());
            script_->pending.pop_front();
            return line;
          }
        }
        std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds{ 2 }));
        return std::nullopt;
      }

      bool isOpen() const override { return open_.load(); }

      void close() override { open_ = false; }

    private:
      std::shared_ptr<FakeSerialScript> script_;
      std::atomic<bool> open_{ false };
    };

    /// Factory for LinkSupervisor that builds fakes bound to \p script.
    inline qube::core::LinkSupervisor::ChannelFactory
    makeFakeFactory(std::shared_ptr<FakeSerialScript> script) {
      return [script]() -> std::unique_ptr<qube::io::SerialChannel> {
        return std::make_unique<FakeSerialChannel>(script);
      };
    }

  } // namespace test
} // namespace qube
