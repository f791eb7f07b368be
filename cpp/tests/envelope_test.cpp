#include <string>

#include <gtest/gtest.h>

#include "touchseal/codec/envelope.hpp"

namespace {
static touchseal::codec::Envelope make_env(const char* c, const char* i, const char* t) {
    touchseal::codec::Envelope e;
    e.challenge = c;
    e.iv = i;
    e.ciphertext = t;
    return e;
}

static void expect_format_error(const char* text) {
    touchseal::codec::Envelope out;
    const touchseal::core::Status s = touchseal::codec::envelope_decode(text, &out);
    EXPECT_EQ(s.domain, touchseal::core::StatusDomain::Input) << text;
    EXPECT_EQ(s.code, touchseal::core::StatusCode::Format) << text;
}
} // namespace

TEST(CodecEnvelope, EncodeJoinsInFixedOrder) {
    std::string out;
    ASSERT_EQ(touchseal::codec::envelope_encode(make_env("chal", "0011", "Q1Q="), &out).code, touchseal::core::StatusCode::Ok);
    EXPECT_EQ(out, "chal:0011:Q1Q=");
}

TEST(CodecEnvelope, DecodeInvertsEncode) {
    const touchseal::codec::Envelope cases[] = {
        make_env("a", "b", "c"),
        make_env("xJ3_k-Zq", "000102030405060708090a0b0c0d0e0f", "aGVsbG8gd29ybGQ="),
        make_env("c", "i", "t with spaces"),
    };
    for (const auto& env : cases) {
        std::string text;
        ASSERT_EQ(touchseal::codec::envelope_encode(env, &text).code, touchseal::core::StatusCode::Ok);
        touchseal::codec::Envelope back;
        ASSERT_EQ(touchseal::codec::envelope_decode(text, &back).code, touchseal::core::StatusCode::Ok);
        EXPECT_EQ(back, env);
    }
}

TEST(CodecEnvelope, ThirdFieldRunsToEndOfString) {
    touchseal::codec::Envelope out;
    ASSERT_EQ(touchseal::codec::envelope_decode("c:i:t:with:colons", &out).code, touchseal::core::StatusCode::Ok);
    EXPECT_EQ(out.challenge, "c");
    EXPECT_EQ(out.iv, "i");
    EXPECT_EQ(out.ciphertext, "t:with:colons");
}

TEST(CodecEnvelope, RejectsMissingOrEmptyFields) {
    expect_format_error("onlyonefield");
    expect_format_error("two:fields");
    expect_format_error("a::c");
    expect_format_error(":b:c");
    expect_format_error("a:b:");
    expect_format_error("::");
    expect_format_error("");
}

TEST(CodecEnvelope, RejectsControlCharactersAndLineBreaks) {
    expect_format_error("a:b:c\n");
    expect_format_error("a\t:b:c");
    expect_format_error("a:b\r:c");
}

TEST(CodecEnvelope, EncodeRejectsDelimiterInLeadingFields) {
    std::string out = "untouched";
    EXPECT_EQ(touchseal::codec::envelope_encode(make_env("a:x", "b", "c"), &out).code, touchseal::core::StatusCode::Invalid);
    EXPECT_EQ(touchseal::codec::envelope_encode(make_env("a", "b:x", "c"), &out).code, touchseal::core::StatusCode::Invalid);
    EXPECT_EQ(touchseal::codec::envelope_encode(make_env("a", "", "c"), &out).code, touchseal::core::StatusCode::Invalid);
    EXPECT_EQ(touchseal::codec::envelope_encode(make_env("a", "b", "line\nbreak"), &out).code, touchseal::core::StatusCode::Invalid);
    EXPECT_EQ(out, "untouched");
}
