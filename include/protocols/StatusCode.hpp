#pragma once
/** @file  StatusCode.hpp
 *  @brief Closed set of student status codes and their display mapping.
 *
 *  © 2025 Qube Monitor — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>

// Qube headers
#include "core/Types.hpp"

namespace qube {
  namespace protocols {

    /**
 * @enum StatusCode
 * @brief What a student currently needs.
 *
 *  * Only Available / Question / HelpNeeded travel over the wire (G / V / R).
 *  * Resolved is set by the teacher and is a resting state like Available.
 */
    enum class StatusCode : std::uint8_t { Available, Question, HelpNeeded, Resolved, Count };
    static_assert(static_cast<std::uint8_t>(StatusCode::Count) == 4,
                  "StatusCode count changed please update code that depends on it");

    /// Maps a wire character to its code; std::nullopt for anything but G, V, R.
    inline std::optional<StatusCode> fromWire(char c) {
      switch (c) {
      case 'G':
        return StatusCode::Available;
      case 'V':
        return StatusCode::Question;
      case 'R':
        return StatusCode::HelpNeeded;
      default:
        return std::nullopt;
      }
    }

    inline const char* displayText(StatusCode code) {
      switch (code) {
      case StatusCode::Available:
        return "Available";
      case StatusCode::Question:
        return "Question";
      case StatusCode::HelpNeeded:
        return "Help needed";
      case StatusCode::Resolved:
        return "Resolved";
      default:
        return "Unknown";
      }
    }

    inline core::Color colorOf(StatusCode code) {
      switch (code) {
      case StatusCode::Available:
        return core::Color::Green;
      case StatusCode::Question:
        return core::Color::Orange;
      case StatusCode::HelpNeeded:
        return core::Color::Red;
      case StatusCode::Resolved:
        return core::Color::Blue;
      default:
        return core::Color::Black;
      }
    }

    /// True while the student is waiting on the teacher.
    inline bool isActive(StatusCode code) {
      return code == StatusCode::Question || code == StatusCode::HelpNeeded;
    }

    /// Resolved compares equal to Available when deciding change vs. repeat.
    inline StatusCode restingEquivalent(StatusCode code) {
      return code == StatusCode::Resolved ? StatusCode::Available : code;
    }

  } // namespace protocols
} // namespace qube
