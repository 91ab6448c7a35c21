/**
 * @file test_protocol.cpp
 * @brief Tests for base64 and the control message codec
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "loanvoice/protocol/base64.h"
#include "loanvoice/protocol/control_message.h"

using namespace loanvoice;

// =============================================================================
// BASE64
// =============================================================================

TEST(Base64, EncodesKnownVectors) {
    auto enc = [](const std::string& s) {
        return base64_encode(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    };
    EXPECT_EQ(enc(""), "");
    EXPECT_EQ(enc("f"), "Zg==");
    EXPECT_EQ(enc("fo"), "Zm8=");
    EXPECT_EQ(enc("foo"), "Zm9v");
    EXPECT_EQ(enc("foobar"), "Zm9vYmFy");
}

TEST(Base64, DecodeIgnoresWhitespace) {
    std::vector<uint8_t> out;
    ASSERT_TRUE(base64_decode("Zm9v\nYmFy\r\n", out));
    EXPECT_EQ(std::string(out.begin(), out.end()), "foobar");
}

TEST(Base64, DecodeAcceptsBinary) {
    std::vector<uint8_t> bytes = {0x00, 0xFF, 0x10, 0x80, 0x7F};
    std::vector<uint8_t> out;
    ASSERT_TRUE(base64_decode(base64_encode(bytes), out));
    EXPECT_EQ(out, bytes);
}

TEST(Base64, DecodeRejectsMalformedInput) {
    std::vector<uint8_t> out;
    EXPECT_FALSE(base64_decode("Zm9v!", out));
    EXPECT_TRUE(out.empty());
    EXPECT_FALSE(base64_decode("Z", out));
    EXPECT_FALSE(base64_decode("Zg==Zg==", out));
    EXPECT_FALSE(base64_decode("Zg=", out));
}

// =============================================================================
// INBOUND PARSING
// =============================================================================

TEST(ControlMessage, ParsesKnownTypes) {
    ControlMessage msg;
    Error error;
    ASSERT_TRUE(parse_control_message(R"({"type":"partial_transcript","data":"Hel"})", msg, error));
    EXPECT_EQ(msg.type, InboundType::PartialTranscript);
    EXPECT_EQ(msg.type_name, "partial_transcript");
    EXPECT_EQ(payload_text(msg.data), "Hel");
    EXPECT_EQ(msg.body["type"], "partial_transcript");
}

TEST(ControlMessage, TypeNamesMapBothWays) {
    const char* names[] = {"status",           "partial_transcript", "final_transcript",
                           "assistant_transcript", "ai_token",       "audio_chunk",
                           "structured_update", "interrupt",         "eligibility_result",
                           "document_verification_required", "error"};
    for (const char* name : names) {
        InboundType type = inbound_type_from_name(name);
        EXPECT_NE(type, InboundType::Unknown) << name;
        EXPECT_STREQ(inbound_type_name(type), name);
    }
}

TEST(ControlMessage, UnknownTypeParsesAsUnknown) {
    ControlMessage msg;
    Error error;
    ASSERT_TRUE(parse_control_message(R"({"type":"tts_voice_changed","data":{}})", msg, error));
    EXPECT_EQ(msg.type, InboundType::Unknown);
    EXPECT_EQ(msg.type_name, "tts_voice_changed");
}

TEST(ControlMessage, MissingDataIsNull) {
    ControlMessage msg;
    Error error;
    ASSERT_TRUE(parse_control_message(R"({"type":"interrupt"})", msg, error));
    EXPECT_TRUE(msg.data.is_null());
    EXPECT_EQ(payload_text(msg.data), "");
}

TEST(ControlMessage, RejectsMalformedFrames) {
    ControlMessage msg;
    Error error;

    EXPECT_FALSE(parse_control_message("{not json", msg, error));
    EXPECT_EQ(error.kind, ErrorKind::Protocol);

    error = Error{};
    EXPECT_FALSE(parse_control_message(R"(["status"])", msg, error));
    EXPECT_EQ(error.kind, ErrorKind::Protocol);

    error = Error{};
    EXPECT_FALSE(parse_control_message(R"({"data":"x"})", msg, error));
    EXPECT_EQ(error.kind, ErrorKind::Protocol);

    error = Error{};
    EXPECT_FALSE(parse_control_message(R"({"type":5})", msg, error));
    EXPECT_EQ(error.kind, ErrorKind::Protocol);
}

TEST(ControlMessage, PayloadTextSerializesNonStrings) {
    EXPECT_EQ(payload_text(Json(42)), "42");
    EXPECT_EQ(payload_text(Json::parse(R"({"a":1})")), R"({"a":1})");
}

// =============================================================================
// OUTBOUND BUILDERS
// =============================================================================

TEST(OutboundMessage, TextInput) {
    Json msg = Json::parse(outbound::text_input("I earn 5000"));
    EXPECT_EQ(msg["type"], "text_input");
    EXPECT_EQ(msg["data"], "I earn 5000");
}

TEST(OutboundMessage, DocumentMessagesCarryDocType) {
    Json data = {{"file", "pan.pdf"}};
    Json uploaded = Json::parse(outbound::document_uploaded(data, "pan"));
    EXPECT_EQ(uploaded["type"], "document_uploaded");
    EXPECT_EQ(uploaded["data"]["file"], "pan.pdf");
    EXPECT_EQ(uploaded["docType"], "pan");

    Json verified = Json::parse(outbound::document_verified(data));
    EXPECT_EQ(verified["type"], "document_verified");
    EXPECT_FALSE(verified.contains("docType"));
}

TEST(OutboundMessage, TypeOnlyMessages) {
    EXPECT_EQ(Json::parse(outbound::interaction_end()), Json({{"type", "interaction_end"}}));
    EXPECT_EQ(Json::parse(outbound::end_of_session()), Json({{"type", "end_of_session"}}));
    EXPECT_EQ(Json::parse(outbound::verification_completed()),
              Json({{"type", "verification_completed"}}));
}

TEST(OutboundMessage, DebugLogUsesMessageField) {
    Json msg = Json::parse(outbound::debug_log("Mic RMS: 0.0100"));
    EXPECT_EQ(msg["type"], "debug_log");
    EXPECT_EQ(msg["message"], "Mic RMS: 0.0100");
    EXPECT_FALSE(msg.contains("data"));
}
