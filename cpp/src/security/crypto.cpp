#include "touchseal/security/crypto.hpp"

#include <cstddef>
#include <cstring>

#if defined(TOUCHSEAL_HAVE_LIBSODIUM)
#include <sodium.h>
#endif

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <openssl/rand.h>

namespace touchseal::security {
    namespace {
        [[nodiscard]] touchseal::core::Status crypto_status(touchseal::core::StatusCode code) noexcept {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Crypto, code);
        }

#if defined(TOUCHSEAL_HAVE_LIBSODIUM)
        touchseal::core::Status ensure_sodium() noexcept {
            if (sodium_init() < 0) {
                return touchseal::core::make_status(touchseal::core::StatusDomain::External, touchseal::core::StatusCode::Unavailable);
            }
            return touchseal::core::ok_status();
        }
#endif
    } // namespace

    touchseal::core::Status cbc_encrypt(const Key256& key,
        const Iv16& iv,
        BufferView pt,
        BufferMut ct_out,
        u32* ct_len) noexcept {
        if (ct_len == nullptr) {
            return crypto_status(touchseal::core::StatusCode::Invalid);
        }
        *ct_len = 0;
        if (!touchseal::core::buffer_ok(pt) || !touchseal::core::buffer_ok(ct_out)) {
            return crypto_status(touchseal::core::StatusCode::Invalid);
        }
        if (ct_out.len < cbc_ciphertext_len(pt.len)) {
            return crypto_status(touchseal::core::StatusCode::Invalid);
        }

        EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
        if (!ctx) {
            return crypto_status(touchseal::core::StatusCode::Unavailable);
        }

        int ok = EVP_EncryptInit_ex(ctx, EVP_aes_256_cbc(), nullptr, key.b, iv.b);

        int out_len = 0;
        int ct_written = 0;
        if (ok && pt.len > 0) {
            ok &= EVP_EncryptUpdate(ctx, ct_out.data, &out_len, pt.data, static_cast<int>(pt.len));
            ct_written += out_len;
        }
        if (ok) {
            ok &= EVP_EncryptFinal_ex(ctx, ct_out.data + ct_written, &out_len);
            ct_written += out_len;
        }
        EVP_CIPHER_CTX_free(ctx);

        if (!ok || static_cast<u32>(ct_written) != cbc_ciphertext_len(pt.len)) {
            return crypto_status(touchseal::core::StatusCode::Crypto);
        }
        *ct_len = static_cast<u32>(ct_written);
        return touchseal::core::ok_status();
    }

    touchseal::core::Status cbc_decrypt(const Key256& key,
        const Iv16& iv,
        BufferView ct,
        BufferMut pt_out,
        u32* pt_len) noexcept {
        if (pt_len == nullptr) {
            return crypto_status(touchseal::core::StatusCode::Invalid);
        }
        *pt_len = 0;
        if (!touchseal::core::buffer_ok(ct) || !touchseal::core::buffer_ok(pt_out)) {
            return crypto_status(touchseal::core::StatusCode::Invalid);
        }
        if (pt_out.len < ct.len) {
            return crypto_status(touchseal::core::StatusCode::Invalid);
        }
        if (ct.len == 0 || (ct.len % kCbcBlockBytes) != 0) {
            return crypto_status(touchseal::core::StatusCode::Crypto);
        }

        EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
        if (!ctx) {
            return crypto_status(touchseal::core::StatusCode::Unavailable);
        }

        int ok = EVP_DecryptInit_ex(ctx, EVP_aes_256_cbc(), nullptr, key.b, iv.b);

        int out_len = 0;
        int pt_written = 0;
        if (ok) {
            ok &= EVP_DecryptUpdate(ctx, pt_out.data, &out_len, ct.data, static_cast<int>(ct.len));
            pt_written += out_len;
        }
        // Final_ex is where bad padding shows up.
        const int final_ok = ok ? EVP_DecryptFinal_ex(ctx, pt_out.data + pt_written, &out_len) : 0;
        EVP_CIPHER_CTX_free(ctx);

        if (!ok || final_ok <= 0) {
            secure_wipe(pt_out.data, pt_out.len);
            return crypto_status(touchseal::core::StatusCode::Crypto);
        }
        pt_written += out_len;
        *pt_len = static_cast<u32>(pt_written);
        return touchseal::core::ok_status();
    }

    touchseal::core::Status hmac_sha256(const Key256& key,
        const BufferView* parts,
        u32 part_count,
        Tag32* out) noexcept {
        if (out == nullptr || (part_count > 0 && parts == nullptr)) {
            return crypto_status(touchseal::core::StatusCode::Invalid);
        }
        for (u32 i = 0; i < part_count; ++i) {
            if (!touchseal::core::buffer_ok(parts[i])) {
                return crypto_status(touchseal::core::StatusCode::Invalid);
            }
        }

        EVP_MAC* mac = EVP_MAC_fetch(nullptr, "HMAC", nullptr);
        if (!mac) {
            return crypto_status(touchseal::core::StatusCode::Unavailable);
        }
        EVP_MAC_CTX* ctx = EVP_MAC_CTX_new(mac);
        if (!ctx) {
            EVP_MAC_free(mac);
            return crypto_status(touchseal::core::StatusCode::Unavailable);
        }

        char digest_name[] = "SHA256";
        const OSSL_PARAM params[] = {
            OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest_name, 0),
            OSSL_PARAM_construct_end(),
        };

        int ok = EVP_MAC_init(ctx, key.b, sizeof(key.b), params);
        for (u32 i = 0; i < part_count && ok; ++i) {
            if (parts[i].len > 0) {
                ok &= EVP_MAC_update(ctx, parts[i].data, static_cast<size_t>(parts[i].len));
            }
        }

        size_t mac_len = 0;
        if (ok) {
            ok &= EVP_MAC_final(ctx, out->b, &mac_len, sizeof(out->b));
        }
        EVP_MAC_CTX_free(ctx);
        EVP_MAC_free(mac);

        if (!ok || mac_len != sizeof(out->b)) {
            return crypto_status(touchseal::core::StatusCode::Crypto);
        }
        return touchseal::core::ok_status();
    }

    bool tag32_equal_ct(const Tag32& a, const Tag32& b) noexcept {
        return CRYPTO_memcmp(a.b, b.b, sizeof(a.b)) == 0;
    }

    touchseal::core::Status random_bytes(BufferMut out) noexcept {
        if (!touchseal::core::buffer_ok(out)) {
            return crypto_status(touchseal::core::StatusCode::Invalid);
        }
        if (out.len == 0) {
            return touchseal::core::ok_status();
        }

#if defined(TOUCHSEAL_HAVE_LIBSODIUM)
        const touchseal::core::Status init = ensure_sodium();
        if (!touchseal::core::is_ok(init)) {
            return init;
        }
        randombytes_buf(out.data, static_cast<size_t>(out.len));
        return touchseal::core::ok_status();
#else
        if (RAND_bytes(out.data, static_cast<int>(out.len)) != 1) {
            return crypto_status(touchseal::core::StatusCode::Unavailable);
        }
        return touchseal::core::ok_status();
#endif
    }

    touchseal::core::Status random_fill(const RandomSource& src, BufferMut out) noexcept {
        if (src.fill == nullptr) {
            return random_bytes(out);
        }
        return src.fill(src.ctx, out);
    }

    void secure_wipe(void* p, std::size_t n) noexcept {
        if (p == nullptr || n == 0) {
            return;
        }
#if defined(TOUCHSEAL_HAVE_LIBSODIUM)
        sodium_memzero(p, n);
#else
        OPENSSL_cleanse(p, n);
#endif
    }
} // namespace touchseal::security
