#include "touchseal/security/hashing.hpp"

#include <cstddef>

#include <blake3.h>
#include <openssl/evp.h>

namespace touchseal::security {
    namespace {
        touchseal::core::Status blake3_compute(const BufferView* parts, u32 part_count, Digest256* out) noexcept {
            blake3_hasher hasher;
            blake3_hasher_init(&hasher);

            for (u32 i = 0; i < part_count; ++i) {
                if (parts[i].len > 0) {
                    blake3_hasher_update(&hasher, parts[i].data, static_cast<size_t>(parts[i].len));
                }
            }

            blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
            return touchseal::core::ok_status();
        }

        touchseal::core::Status sha256_compute(const BufferView* parts, u32 part_count, Digest256* out) noexcept {
            EVP_MD_CTX* ctx = EVP_MD_CTX_new();
            if (!ctx) {
                return touchseal::core::make_status(touchseal::core::StatusDomain::Crypto, touchseal::core::StatusCode::Unavailable);
            }

            int ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
            for (u32 i = 0; i < part_count && ok; ++i) {
                if (parts[i].len > 0) {
                    ok &= EVP_DigestUpdate(ctx, parts[i].data, static_cast<size_t>(parts[i].len));
                }
            }

            unsigned int md_len = 0;
            if (ok) {
                ok &= EVP_DigestFinal_ex(ctx, out->b.data(), &md_len);
            }
            EVP_MD_CTX_free(ctx);

            if (!ok || md_len != out->b.size()) {
                return touchseal::core::make_status(touchseal::core::StatusDomain::Crypto, touchseal::core::StatusCode::Crypto);
            }
            return touchseal::core::ok_status();
        }
    } // namespace

    touchseal::core::Status hash_compute(HashId hash,
        const BufferView* parts,
        u32 part_count,
        Digest256* out) noexcept {
        if (out == nullptr) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Crypto, touchseal::core::StatusCode::Invalid);
        }
        if (part_count > 0 && parts == nullptr) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Crypto, touchseal::core::StatusCode::Invalid);
        }
        for (u32 i = 0; i < part_count; ++i) {
            if (!touchseal::core::buffer_ok(parts[i])) {
                return touchseal::core::make_status(touchseal::core::StatusDomain::Crypto, touchseal::core::StatusCode::Invalid);
            }
        }

        switch (hash) {
        case HashId::Sha256:
            return sha256_compute(parts, part_count, out);
        case HashId::Blake3:
            return blake3_compute(parts, part_count, out);
        }
        return touchseal::core::make_status(touchseal::core::StatusDomain::Crypto, touchseal::core::StatusCode::Unsupported);
    }
} // namespace touchseal::security
