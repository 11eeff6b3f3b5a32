/* @file StatusCodec.cpp
 * @brief line protocol decoder - splits, trims and validates one radio status line
 *
 * © 2025 Qube Monitor — MIT-licensed.
 */

// STL headers
#include <charconv>
#include <cstddef>
#include <vector>

// Qube headers
#include "protocols/StatusCodec.hpp"

using namespace qube::protocols;

namespace {

  std::string_view trim(std::string_view s) {
    const char* ws = " \t\r\n";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos)
      return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
  }

  std::vector<std::string_view> splitFields(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
      const auto comma = line.find(',', start);
      if (comma == std::string_view::npos) {
        fields.push_back(trim(line.substr(start)));
        break;
      }
      fields.push_back(trim(line.substr(start, comma - start)));
      start = comma + 1;
    }
    return fields;
  }

  // digits only, whole field consumed; a leading sign or inner blank is rejected
  bool parseStudentId(std::string_view field, qube::core::StudentId& out) {
    if (field.empty() || field.size() > 9)
      return false;
    for (char c : field) {
      if (c < '0' || c > '9')
        return false;
    }
    long long value = 0;
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
    if (ec != std::errc{} || ptr != field.data() + field.size())
      return false;
    if (!qube::core::isValidStudentId(value))
      return false;
    out = static_cast<qube::core::StudentId>(value);
    return true;
  }

} // namespace

DecodeResult StatusCodec::decode(std::string_view line, qube::core::SteadyTime receivedAt) {
  const auto fields = splitFields(trim(line));

  if (fields.size() < 3)
    return Rejection{ RejectReason::MalformedLine, std::string(line) };

  const auto role = fields[0];
  if (role.empty() || role.front() != 'L')
    return Rejection{ RejectReason::UnrecognizedRole, std::string(role) };

  DecodedEvent event;
  if (!parseStudentId(fields[1], event.studentId))
    return Rejection{ RejectReason::InvalidStudentId, std::string(fields[1]) };

  const auto codeField = fields[2];
  std::optional<StatusCode> code;
  if (codeField.size() == 1)
    code = fromWire(codeField.front());
  if (!code)
    return Rejection{ RejectReason::UnknownStatusCode, std::string(codeField) };

  event.code = *code;
  event.receivedAt = receivedAt;
  return event;
}

// -------------------------------------------------------------------
// sanitizeUtf8
// Walks the buffer once; overlong forms, surrogates and code points
// above U+10FFFF count as invalid. Each maximal invalid prefix becomes
// a single U+FFFD.
// -------------------------------------------------------------------
std::string qube::protocols::sanitizeUtf8(std::string_view raw) {
  static constexpr const char* kReplacement = "\xEF\xBF\xBD";

  std::string out;
  out.reserve(raw.size());

  std::size_t i = 0;
  while (i < raw.size()) {
    const auto lead = static_cast<unsigned char>(raw[i]);

    if (lead < 0x80) {
      out.push_back(static_cast<char>(lead));
      ++i;
      continue;
    }

    std::size_t len = 0;
    unsigned char lo = 0x80, hi = 0xBF; // valid range of the 2nd byte
    if (lead >= 0xC2 && lead <= 0xDF) {
      len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      len = 3;
      if (lead == 0xE0)
        lo = 0xA0;
      if (lead == 0xED)
        hi = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      len = 4;
      if (lead == 0xF0)
        lo = 0x90;
      if (lead == 0xF4)
        hi = 0x8F;
    }

    if (len == 0) {
      out += kReplacement;
      ++i;
      continue;
    }

    std::size_t consumed = 1;
    bool valid = true;
    for (; consumed < len; ++consumed) {
      if (i + consumed >= raw.size()) {
        valid = false;
        break;
      }
      const auto c = static_cast<unsigned char>(raw[i + consumed]);
      const unsigned char min = consumed == 1 ? lo : 0x80;
      const unsigned char max = consumed == 1 ? hi : 0xBF;
      if (c < min || c > max) {
        valid = false;
        break;
      }
    }

    if (valid) {
      out.append(raw.data() + i, len);
      i += len;
    } else {
      out += kReplacement;
      i += consumed;
    }
  }
  return out;
}
