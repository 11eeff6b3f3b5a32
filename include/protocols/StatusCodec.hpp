#pragma once
/** @file  StatusCodec.hpp
 *  @brief Stateless decoder for `<role>,<studentId>,<statusCode>` lines.
 *
 *  © 2025 Qube Monitor — MIT-licensed.
 */

// STL headers
#include <string>
#include <string_view>
#include <variant>

// Qube headers
#include "core/Types.hpp"
#include "protocols/StatusCode.hpp"

namespace qube {
  namespace protocols {

    struct DecodedEvent {
      core::StudentId studentId{ 0 };
      StatusCode code{ StatusCode::Available };
      core::SteadyTime receivedAt{};
    };

    enum class RejectReason : std::uint8_t {
      MalformedLine,
      UnrecognizedRole,
      InvalidStudentId,
      UnknownStatusCode
    };

    inline const char* toString(RejectReason r) {
      switch (r) {
      case RejectReason::MalformedLine:
        return "malformed line";
      case RejectReason::UnrecognizedRole:
        return "unrecognized role";
      case RejectReason::InvalidStudentId:
        return "invalid student id";
      case RejectReason::UnknownStatusCode:
        return "unknown status code";
      default:
        return "unknown";
      }
    }

    struct Rejection {
      RejectReason reason{ RejectReason::MalformedLine };
      std::string detail; ///< offending field, for the log
    };

    using DecodeResult = std::variant<DecodedEvent, Rejection>;

    /**
 * @class StatusCodec
 * @brief Validates one raw line in a fixed order; first failure wins.
 *
 *  1. fewer than 3 fields        → MalformedLine
 *  2. role not starting with 'L' → UnrecognizedRole
 *  3. id not in [100000, 999999] → InvalidStudentId
 *  4. code not in {G, V, R}      → UnknownStatusCode
 *
 *  Fields past the third are ignored. Allow-list membership is not checked here.
 */
    class StatusCodec {
    public:
      static DecodeResult decode(std::string_view line, core::SteadyTime receivedAt);
    };

    /// Replaces each invalid UTF-8 sequence with U+FFFD.
    std::string sanitizeUtf8(std::string_view raw);

  } // namespace protocols
} // namespace qube
