#pragma once
/** @file  Types.hpp
 *  @brief Vocabulary types shared by every layer (ids, display colors, clocks).
 *
 *  © 2025 Qube Monitor — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>

namespace qube {
  namespace core {

    using StudentId = std::uint32_t;

    static constexpr StudentId kMinStudentId = 100000;
    static constexpr StudentId kMaxStudentId = 999999;

    inline bool isValidStudentId(long long id) { return id >= kMinStudentId && id <= kMaxStudentId; }

    using SteadyTime = std::chrono::steady_clock::time_point;
    using WallTime = std::chrono::system_clock::time_point;

    /// Display color / severity tag handed to the presentation layer.
    enum class Color : std::uint8_t { Green, Orange, Red, Blue, Gray, Black, Count };
    static_assert(static_cast<std::uint8_t>(Color::Count) == 6,
                  "Color count changed please update code that depends on it");

    inline const char* toString(Color c) {
      switch (c) {
      case Color::Green:
        return "green";
      case Color::Orange:
        return "orange";
      case Color::Red:
        return "red";
      case Color::Blue:
        return "blue";
      case Color::Gray:
        return "gray";
      case Color::Black:
        return "black";
      default:
        return "unknown";
      }
    }

  } // namespace core
} // namespace qube
