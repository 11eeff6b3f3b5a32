#pragma once
/** @file  Clock.hpp
 *  @brief Injectable time source (steady for intervals, wall for log stamps).
 *
 *  © 2025 Qube Monitor — MIT-licensed.
 */

// Qube headers
#include "core/Types.hpp"

namespace qube::core {

  /**
 * @class Clock
 * @brief Production clock; tests substitute a manually advanced fake.
 *
 * * Must be safe to call from the read loop, the health loop and the
 *   operator surface concurrently.
 */
  class Clock {
  public:
    virtual ~Clock() = default;

    virtual SteadyTime now() const { return std::chrono::steady_clock::now(); }
    virtual WallTime wallNow() const { return std::chrono::system_clock::now(); }
  };

} // namespace qube::core
