#include <array>
#include <cstring>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "touchseal/codec/encoding.hpp"

namespace {
static touchseal::codec::BufferView text_view(const char* s) {
    return touchseal::core::view_of(s, std::char_traits<char>::length(s));
}

static std::string to_string(const std::vector<touchseal::core::u8>& v) {
    return std::string(v.begin(), v.end());
}
} // namespace

TEST(CodecBase64, Rfc4648Vectors) {
    const char* inputs[] = {"f", "fo", "foo", "foob", "fooba", "foobar"};
    const char* padded[] = {"Zg==", "Zm8=", "Zm9v", "Zm9vYg==", "Zm9vYmE=", "Zm9vYmFy"};
    const char* unpadded[] = {"Zg", "Zm8", "Zm9v", "Zm9vYg", "Zm9vYmE", "Zm9vYmFy"};

    for (size_t i = 0; i < 6; ++i) {
        std::string out;
        ASSERT_EQ(touchseal::codec::base64_encode(text_view(inputs[i]), touchseal::codec::Base64Variant::Standard, &out).code,
                  touchseal::core::StatusCode::Ok);
        EXPECT_EQ(out, padded[i]);

        ASSERT_EQ(touchseal::codec::base64_encode(text_view(inputs[i]), touchseal::codec::Base64Variant::StandardNoPad, &out).code,
                  touchseal::core::StatusCode::Ok);
        EXPECT_EQ(out, unpadded[i]);
        EXPECT_EQ(out.size(), touchseal::codec::base64_encoded_len(static_cast<touchseal::core::u32>(std::strlen(inputs[i])),
                                  touchseal::codec::Base64Variant::StandardNoPad));

        std::vector<touchseal::core::u8> back;
        ASSERT_EQ(touchseal::codec::base64_decode(padded[i], touchseal::codec::Base64Variant::Standard, &back).code,
                  touchseal::core::StatusCode::Ok);
        EXPECT_EQ(to_string(back), inputs[i]);

        ASSERT_EQ(touchseal::codec::base64_decode(unpadded[i], touchseal::codec::Base64Variant::UrlNoPad, &back).code,
                  touchseal::core::StatusCode::Ok);
        EXPECT_EQ(to_string(back), inputs[i]);
    }
}

TEST(CodecBase64, UrlAlphabetAvoidsPlusSlashAndColon) {
    const std::array<touchseal::core::u8, 3> bytes = {0xfb, 0xff, 0xbf};

    std::string std_out;
    std::string url_out;
    ASSERT_EQ(touchseal::codec::base64_encode({bytes.data(), 3}, touchseal::codec::Base64Variant::Standard, &std_out).code,
              touchseal::core::StatusCode::Ok);
    ASSERT_EQ(touchseal::codec::base64_encode({bytes.data(), 3}, touchseal::codec::Base64Variant::UrlNoPad, &url_out).code,
              touchseal::core::StatusCode::Ok);
    EXPECT_EQ(std_out, "+/+/");
    EXPECT_EQ(url_out, "-_-_");

    std::vector<touchseal::core::u8> back;
    ASSERT_EQ(touchseal::codec::base64_decode(url_out, touchseal::codec::Base64Variant::UrlNoPad, &back).code,
              touchseal::core::StatusCode::Ok);
    EXPECT_EQ(back, std::vector<touchseal::core::u8>(bytes.begin(), bytes.end()));
}

TEST(CodecBase64, StrictDecodeRejectsMalformedInput) {
    const char* bad_standard[] = {"Zg=", "Z===", "Zg=a", "Zm9v!A==", "Zm:v", "-_-_"};
    for (const char* s : bad_standard) {
        std::vector<touchseal::core::u8> out;
        const touchseal::core::Status st = touchseal::codec::base64_decode(s, touchseal::codec::Base64Variant::Standard, &out);
        EXPECT_EQ(st.domain, touchseal::core::StatusDomain::Input) << s;
        EXPECT_EQ(st.code, touchseal::core::StatusCode::Format) << s;
    }

    const char* bad_url[] = {"Zg==", "Z", "+/+/", "ab:c"};
    for (const char* s : bad_url) {
        std::vector<touchseal::core::u8> out;
        EXPECT_EQ(touchseal::codec::base64_decode(s, touchseal::codec::Base64Variant::UrlNoPad, &out).code,
                  touchseal::core::StatusCode::Format)
            << s;
    }
}

TEST(CodecBase64, NonZeroTrailingBitsAreRejected) {
    struct Case {
        const char* canonical;
        const char* dirty;
        touchseal::codec::Base64Variant variant;
    };
    const Case cases[] = {
        {"AA==", "AB==", touchseal::codec::Base64Variant::Standard},
        {"AAA=", "AAB=", touchseal::codec::Base64Variant::Standard},
        {"AA", "AB", touchseal::codec::Base64Variant::StandardNoPad},
        {"AAA", "AAB", touchseal::codec::Base64Variant::UrlNoPad},
        {"Zm8", "Zm9", touchseal::codec::Base64Variant::UrlNoPad},
    };
    for (const Case& c : cases) {
        std::vector<touchseal::core::u8> out;
        EXPECT_EQ(touchseal::codec::base64_decode(c.canonical, c.variant, &out).code, touchseal::core::StatusCode::Ok)
            << c.canonical;

        const touchseal::core::Status st = touchseal::codec::base64_decode(c.dirty, c.variant, &out);
        EXPECT_EQ(st.domain, touchseal::core::StatusDomain::Input) << c.dirty;
        EXPECT_EQ(st.code, touchseal::core::StatusCode::Format) << c.dirty;
        EXPECT_TRUE(out.empty()) << c.dirty;
    }
}

TEST(CodecHex, EncodeLowercaseAndDecodeExactLength) {
    const std::array<touchseal::core::u8, 4> bytes = {0x00, 0x1f, 0xa0, 0xff};
    std::string hex;
    ASSERT_EQ(touchseal::codec::hex_encode({bytes.data(), 4}, &hex).code, touchseal::core::StatusCode::Ok);
    EXPECT_EQ(hex, "001fa0ff");

    std::array<touchseal::core::u8, 4> back{};
    ASSERT_EQ(touchseal::codec::hex_decode("001FA0ff", {back.data(), 4}).code, touchseal::core::StatusCode::Ok);
    EXPECT_EQ(back, bytes);

    EXPECT_EQ(touchseal::codec::hex_decode("001fa0", {back.data(), 4}).code, touchseal::core::StatusCode::Format);
    EXPECT_EQ(touchseal::codec::hex_decode("001fa0ffee", {back.data(), 4}).code, touchseal::core::StatusCode::Format);
    EXPECT_EQ(touchseal::codec::hex_decode("001fa0fg", {back.data(), 4}).code, touchseal::core::StatusCode::Format);
}
