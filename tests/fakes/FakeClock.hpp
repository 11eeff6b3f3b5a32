#pragma once
/** @file  FakeClock.hpp
 *  @brief Manually advanced Clock for deterministic timing tests.
 *
 *  © 2025 Qube Monitor — MIT-licensed.
 */

#include <mutex>

#include "core/Clock.hpp"

namespace qube {
  namespace test {

    class FakeClock : public qube::core::Clock {
    public:
      qube::core::SteadyTime now() const override {
        std::lock_guard<std::mutex> lock(mtx_);
        return steady_;
      }

      qube::core::WallTime wallNow() const override {
        std::lock_guard<std::mutex> lock(mtx_);
        return wall_;
      }

      /// Moves both time lines forward by \p d.
      template <typename Rep, typename Period>
      void advance(std::chrono::duration<Rep, Period> d) {
        std::lock_guard<std::mutex> lock(mtx_);
        steady_ += std::chrono::duration_cast<std::chrono::steady_clock::duration>(d);
        wall_ += std::chrono::duration_cast<std::chrono::system_clock::duration>(d);
      }

    private:
      mutable std::mutex mtx_;
      qube::core::SteadyTime steady_{ std::chrono::hours{ 1000 } };
      qube::core::WallTime wall_{ std::chrono::hours{ 480000 } };
    };

  } // namespace test
} // namespace qube
