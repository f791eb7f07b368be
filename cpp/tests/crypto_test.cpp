#include <array>
#include <cstddef>
#include <cstring>
#include <vector>

#include <gtest/gtest.h>

#include "touchseal/security/crypto.hpp"

namespace {
static touchseal::security::Key256 make_key256_seq(touchseal::core::u8 start) {
    touchseal::security::Key256 k{};
    for (size_t i = 0; i < 32; ++i) {
        k.b[i] = static_cast<touchseal::core::u8>(start + static_cast<touchseal::core::u8>(i));
    }
    return k;
}

static touchseal::security::Iv16 make_iv16_seq(touchseal::core::u8 start) {
    touchseal::security::Iv16 iv{};
    for (size_t i = 0; i < 16; ++i) {
        iv.b[i] = static_cast<touchseal::core::u8>(start + static_cast<touchseal::core::u8>(i));
    }
    return iv;
}

static touchseal::core::Status fail_fill(void*, touchseal::core::BufferMut) noexcept {
    return touchseal::core::make_status(touchseal::core::StatusDomain::Crypto, touchseal::core::StatusCode::Unavailable);
}

static touchseal::core::Status fill_with_ctx_byte(void* ctx, touchseal::core::BufferMut out) noexcept {
    const auto v = *static_cast<const touchseal::core::u8*>(ctx);
    std::memset(out.data, v, out.len);
    return touchseal::core::ok_status();
}
} // namespace

TEST(SecurityCrypto, CiphertextLenAlwaysPads) {
    EXPECT_EQ(touchseal::security::cbc_ciphertext_len(0), 16u);
    EXPECT_EQ(touchseal::security::cbc_ciphertext_len(1), 16u);
    EXPECT_EQ(touchseal::security::cbc_ciphertext_len(15), 16u);
    EXPECT_EQ(touchseal::security::cbc_ciphertext_len(16), 32u);
    EXPECT_EQ(touchseal::security::cbc_ciphertext_len(33), 48u);
}

TEST(SecurityCrypto, Aes256CbcKnownAnswerFirstBlock) {
    // NIST SP 800-38A F.2.5, first block; the second block is PKCS#7 padding.
    const touchseal::security::Key256 key{{
        0x60, 0x3d, 0xeb, 0x10, 0x15, 0xca, 0x71, 0xbe, 0x2b, 0x73, 0xae, 0xf0, 0x85, 0x7d, 0x77, 0x81,
        0x1f, 0x35, 0x2c, 0x07, 0x3b, 0x61, 0x08, 0xd7, 0x2d, 0x98, 0x10, 0xa3, 0x09, 0x14, 0xdf, 0xf4,
    }};
    const touchseal::security::Iv16 iv = make_iv16_seq(0);
    const std::array<touchseal::core::u8, 16> pt = {
        0x6b, 0xc1, 0xbe, 0xe2, 0x2e, 0x40, 0x9f, 0x96, 0xe9, 0x3d, 0x7e, 0x11, 0x73, 0x93, 0x17, 0x2a,
    };
    const std::array<touchseal::core::u8, 16> expected = {
        0xf5, 0x8c, 0x4c, 0x04, 0xd6, 0xe5, 0xf1, 0xba, 0x77, 0x9e, 0xab, 0xfb, 0x5f, 0x7b, 0xfb, 0xd6,
    };

    std::array<touchseal::core::u8, 32> ct{};
    touchseal::core::u32 ct_len = 0;
    const touchseal::core::Status s = touchseal::security::cbc_encrypt(key, iv, {pt.data(), 16}, {ct.data(), 32}, &ct_len);
    ASSERT_EQ(s.code, touchseal::core::StatusCode::Ok);
    ASSERT_EQ(ct_len, 32u);
    EXPECT_EQ(0, std::memcmp(ct.data(), expected.data(), 16));
}

TEST(SecurityCrypto, CbcRoundTrip) {
    const auto key = make_key256_seq(1);
    const auto iv = make_iv16_seq(40);
    const char msg[] = "hello world";
    const auto pt = touchseal::core::view_of(msg, sizeof(msg) - 1);

    std::array<touchseal::core::u8, 16> ct{};
    touchseal::core::u32 ct_len = 0;
    ASSERT_EQ(touchseal::security::cbc_encrypt(key, iv, pt, {ct.data(), 16}, &ct_len).code, touchseal::core::StatusCode::Ok);
    ASSERT_EQ(ct_len, 16u);

    std::array<touchseal::core::u8, 16> out{};
    touchseal::core::u32 out_len = 0;
    ASSERT_EQ(touchseal::security::cbc_decrypt(key, iv, {ct.data(), ct_len}, {out.data(), 16}, &out_len).code,
              touchseal::core::StatusCode::Ok);
    ASSERT_EQ(out_len, pt.len);
    EXPECT_EQ(0, std::memcmp(out.data(), msg, pt.len));
}

TEST(SecurityCrypto, EncryptRejectsShortOutput) {
    const auto key = make_key256_seq(1);
    const auto iv = make_iv16_seq(0);
    const std::array<touchseal::core::u8, 16> pt{};
    std::array<touchseal::core::u8, 16> ct{};
    touchseal::core::u32 ct_len = 7;

    const touchseal::core::Status s = touchseal::security::cbc_encrypt(key, iv, {pt.data(), 16}, {ct.data(), 16}, &ct_len);
    EXPECT_EQ(s.domain, touchseal::core::StatusDomain::Crypto);
    EXPECT_EQ(s.code, touchseal::core::StatusCode::Invalid);
    EXPECT_EQ(ct_len, 0u);
}

TEST(SecurityCrypto, DecryptRejectsPartialBlock) {
    const auto key = make_key256_seq(1);
    const auto iv = make_iv16_seq(0);
    const std::array<touchseal::core::u8, 15> ct{};
    std::array<touchseal::core::u8, 15> out{};
    touchseal::core::u32 out_len = 0;

    const touchseal::core::Status s = touchseal::security::cbc_decrypt(key, iv, {ct.data(), 15}, {out.data(), 15}, &out_len);
    EXPECT_EQ(s.domain, touchseal::core::StatusDomain::Crypto);
    EXPECT_EQ(s.code, touchseal::core::StatusCode::Crypto);
}

TEST(SecurityCrypto, DecryptWithWrongKeyNeverReturnsPlaintext) {
    const auto key = make_key256_seq(1);
    const auto iv = make_iv16_seq(0);
    const std::array<touchseal::core::u8, 20> pt = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16, 17, 18, 19, 20};

    std::array<touchseal::core::u8, 32> ct{};
    touchseal::core::u32 ct_len = 0;
    ASSERT_EQ(touchseal::security::cbc_encrypt(key, iv, {pt.data(), 20}, {ct.data(), 32}, &ct_len).code,
              touchseal::core::StatusCode::Ok);

    // A wrong key yields valid padding by chance about once in 256 tries;
    // either way the recovered bytes must not be the plaintext.
    const auto other = make_key256_seq(2);
    std::array<touchseal::core::u8, 32> out{};
    touchseal::core::u32 out_len = 0;
    const touchseal::core::Status s =
        touchseal::security::cbc_decrypt(other, iv, {ct.data(), ct_len}, {out.data(), 32}, &out_len);
    if (touchseal::core::is_ok(s)) {
        EXPECT_FALSE(out_len == 20 && std::memcmp(out.data(), pt.data(), 20) == 0);
    } else {
        EXPECT_EQ(s.domain, touchseal::core::StatusDomain::Crypto);
        EXPECT_EQ(s.code, touchseal::core::StatusCode::Crypto);
        EXPECT_EQ(out_len, 0u);
    }
}

TEST(SecurityCrypto, HmacPartsMatchConcatenation) {
    const auto key = make_key256_seq(7);
    const char whole[] = "challengeivciphertext";
    const touchseal::core::BufferView one = touchseal::core::view_of(whole, 21);
    const touchseal::core::BufferView parts[] = {
        touchseal::core::view_of(whole, 9),
        touchseal::core::view_of(whole + 9, 2),
        touchseal::core::view_of(whole + 11, 10),
    };

    touchseal::security::Tag32 a{};
    touchseal::security::Tag32 b{};
    ASSERT_EQ(touchseal::security::hmac_sha256(key, &one, 1, &a).code, touchseal::core::StatusCode::Ok);
    ASSERT_EQ(touchseal::security::hmac_sha256(key, parts, 3, &b).code, touchseal::core::StatusCode::Ok);
    EXPECT_TRUE(touchseal::security::tag32_equal_ct(a, b));

    touchseal::security::Tag32 c{};
    ASSERT_EQ(touchseal::security::hmac_sha256(make_key256_seq(8), &one, 1, &c).code, touchseal::core::StatusCode::Ok);
    EXPECT_FALSE(touchseal::security::tag32_equal_ct(a, c));
}

TEST(SecurityCrypto, HmacRejectsNullOut) {
    const auto key = make_key256_seq(7);
    const touchseal::core::Status s = touchseal::security::hmac_sha256(key, nullptr, 0, nullptr);
    EXPECT_EQ(s.domain, touchseal::core::StatusDomain::Crypto);
    EXPECT_EQ(s.code, touchseal::core::StatusCode::Invalid);
}

TEST(SecurityCrypto, RandomBytesFillsAndDiffers) {
    std::array<touchseal::core::u8, 32> a{};
    std::array<touchseal::core::u8, 32> b{};
    ASSERT_EQ(touchseal::security::random_bytes({a.data(), 32}).code, touchseal::core::StatusCode::Ok);
    ASSERT_EQ(touchseal::security::random_bytes({b.data(), 32}).code, touchseal::core::StatusCode::Ok);
    EXPECT_NE(a, b);

    EXPECT_EQ(touchseal::security::random_bytes({nullptr, 4}).code, touchseal::core::StatusCode::Invalid);
}

TEST(SecurityCrypto, RandomFillUsesInjectedSource) {
    touchseal::core::u8 value = 0x5a;
    touchseal::security::RandomSource src{};
    src.fill = &fill_with_ctx_byte;
    src.ctx = &value;

    std::array<touchseal::core::u8, 8> out{};
    ASSERT_EQ(touchseal::security::random_fill(src, {out.data(), 8}).code, touchseal::core::StatusCode::Ok);
    for (const auto v : out) {
        EXPECT_EQ(v, 0x5a);
    }

    src.fill = &fail_fill;
    const touchseal::core::Status s = touchseal::security::random_fill(src, {out.data(), 8});
    EXPECT_EQ(s.code, touchseal::core::StatusCode::Unavailable);
}

TEST(SecurityCrypto, SecureWipeZeroes) {
    std::vector<touchseal::core::u8> buf(64, 0xee);
    touchseal::security::secure_wipe(buf.data(), buf.size());
    for (const auto v : buf) {
        EXPECT_EQ(v, 0);
    }
    touchseal::security::secure_wipe(nullptr, 10);
}
