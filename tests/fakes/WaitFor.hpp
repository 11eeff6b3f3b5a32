#pragma once
/** @file  WaitFor.hpp
 *  @brief Polls a predicate until it holds or a real-time deadline passes.
 *
 *  © 2025 Qube Monitor — MIT-licensed.
 */

#include <chrono>
#include <thread>

namespace qube {
  namespace test {

    template <typename Pred>
    bool waitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds{ 2000 }) {
      const auto deadline = std::chrono::steady_clock::now() + timeout;
      while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
          return true;
        std::this_thread::sleep_for(std::chrono::milliseconds{ 2 });
      }
      return pred();
    }

  } // namespace test
} // namespace qube
