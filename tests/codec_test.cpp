#include "protocols/StatusCodec.hpp"

#include <gtest/gtest.h>

using namespace qube::protocols;
using qube::core::SteadyTime;

namespace {

  const SteadyTime kAt{ std::chrono::seconds{ 42 } };

  DecodedEvent expectEvent(const std::string& line) {
    auto result = StatusCodec::decode(line, kAt);
    EXPECT_TRUE(std::holds_alternative<DecodedEvent>(result)) << line;
    if (auto* ev = std::get_if<DecodedEvent>(&result))
      return *ev;
    return {};
  }

  RejectReason expectRejection(const std::string& line) {
    auto result = StatusCodec::decode(line, kAt);
    EXPECT_TRUE(std::holds_alternative<Rejection>(result)) << line;
    if (auto* r = std::get_if<Rejection>(&result))
      return r->reason;
    return RejectReason::MalformedLine;
  }

} // namespace

TEST(status_codec, decodes_each_wire_code) {
  auto g = expectEvent("L,123456,G");
  EXPECT_EQ(g.studentId, 123456u);
  EXPECT_EQ(g.code, StatusCode::Available);
  EXPECT_EQ(g.receivedAt, kAt);

  EXPECT_EQ(expectEvent("L,123456,V").code, StatusCode::Question);
  EXPECT_EQ(expectEvent("L,123456,R").code, StatusCode::HelpNeeded);
}

TEST(status_codec, trims_fields_and_ignores_extras) {
  auto ev = expectEvent("  L , 654321 , R ,extra,fields\r\n");
  EXPECT_EQ(ev.studentId, 654321u);
  EXPECT_EQ(ev.code, StatusCode::HelpNeeded);
}

TEST(status_codec, role_only_needs_leading_L) {
  EXPECT_EQ(expectEvent("LEARNER,100000,G").studentId, 100000u);
  EXPECT_EQ(expectEvent("L,999999,G").studentId, 999999u);
}

TEST(status_codec, too_few_fields_is_malformed) {
  EXPECT_EQ(expectRejection(""), RejectReason::MalformedLine);
  EXPECT_EQ(expectRejection("L,123456"), RejectReason::MalformedLine);
  EXPECT_EQ(expectRejection("HEALTH_CHECK"), RejectReason::MalformedLine);
}

TEST(status_codec, wrong_role_is_rejected) {
  EXPECT_EQ(expectRejection("T,123456,G"), RejectReason::UnrecognizedRole);
  EXPECT_EQ(expectRejection(",123456,G"), RejectReason::UnrecognizedRole);
  EXPECT_EQ(expectRejection("l,123456,G"), RejectReason::UnrecognizedRole);
}

TEST(status_codec, student_id_must_be_six_digits_in_range) {
  EXPECT_EQ(expectRejection("L,99999,G"), RejectReason::InvalidStudentId);
  EXPECT_EQ(expectRejection("L,1000000,G"), RejectReason::InvalidStudentId);
  EXPECT_EQ(expectRejection("L,12a456,G"), RejectReason::InvalidStudentId);
  EXPECT_EQ(expectRejection("L,-123456,G"), RejectReason::InvalidStudentId);
  EXPECT_EQ(expectRejection("L,,G"), RejectReason::InvalidStudentId);
}

TEST(status_codec, signed_or_split_student_id_is_rejected) {
  EXPECT_EQ(expectRejection("L,+123456,G"), RejectReason::InvalidStudentId);
  EXPECT_EQ(expectRejection("L,123 456,G"), RejectReason::InvalidStudentId);
  EXPECT_EQ(expectRejection("L, 123 456,G"), RejectReason::InvalidStudentId);
}

TEST(status_codec, unknown_code_is_rejected) {
  EXPECT_EQ(expectRejection("L,123456,X"), RejectReason::UnknownStatusCode);
  EXPECT_EQ(expectRejection("L,123456,g"), RejectReason::UnknownStatusCode);
  EXPECT_EQ(expectRejection("L,123456,GV"), RejectReason::UnknownStatusCode);
  EXPECT_EQ(expectRejection("L,123456,"), RejectReason::UnknownStatusCode);
}

TEST(status_codec, first_failing_check_wins) {
  // bad role and bad id: role is checked first
  EXPECT_EQ(expectRejection("X,12,Q"), RejectReason::UnrecognizedRole);
  EXPECT_EQ(expectRejection("L,12,Q"), RejectReason::InvalidStudentId);
}

TEST(status_codec, rejection_names_offending_field) {
  auto result = StatusCodec::decode("L,123456,Z", kAt);
  ASSERT_TRUE(std::holds_alternative<Rejection>(result));
  EXPECT_EQ(std::get<Rejection>(result).detail, "Z");
}

TEST(sanitize_utf8, keeps_valid_text) {
  EXPECT_EQ(sanitizeUtf8("L,123456,G"), "L,123456,G");
  EXPECT_EQ(sanitizeUtf8("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80"),
            "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80");
}

TEST(sanitize_utf8, replaces_invalid_sequences) {
  const std::string fffd = "\xEF\xBF\xBD";
  EXPECT_EQ(sanitizeUtf8("a\xFF"
                         "b"),
            "a" + fffd + "b");
  EXPECT_EQ(sanitizeUtf8("\xC0\xAF"), fffd + fffd);     // overlong '/'
  EXPECT_EQ(sanitizeUtf8("\xED\xA0\x80"), fffd + fffd + fffd); // surrogate
  EXPECT_EQ(sanitizeUtf8("x\xE2\x82"), "x" + fffd);     // truncated at end
}

TEST(sanitize_utf8, garbled_line_still_decodes_as_rejection) {
  auto result = StatusCodec::decode(sanitizeUtf8("L,12\xFE"
                                                 "456,G"),
                                    kAt);
  ASSERT_TRUE(std::holds_alternative<Rejection>(result));
  EXPECT_EQ(std::get<Rejection>(result).reason, RejectReason::InvalidStudentId);
}
