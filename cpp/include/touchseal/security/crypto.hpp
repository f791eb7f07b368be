#pragma once
#include <cstddef>
#include <type_traits>

#include "touchseal/core/errors.hpp"
#include "touchseal/core/types.hpp"

namespace touchseal::security {
    using u8 = touchseal::core::u8;
    using u32 = touchseal::core::u32;
    using BufferView = touchseal::core::BufferView;
    using BufferMut = touchseal::core::BufferMut;

    struct Key256 {
        u8 b[32]{};
    };

    struct Iv16 {
        u8 b[16]{};
    };

    struct Tag32 {
        u8 b[32]{};
    };

    inline constexpr u32 kCbcBlockBytes = 16;

    // PKCS#7 always adds at least one byte of padding.
    [[nodiscard]] constexpr u32 cbc_ciphertext_len(u32 pt_len) noexcept {
        return (pt_len / kCbcBlockBytes + 1) * kCbcBlockBytes;
    }

    // AES-256-CBC with PKCS#7 padding. ct_out.len must be >= cbc_ciphertext_len(pt.len).
    touchseal::core::Status cbc_encrypt(const Key256& key,
        const Iv16& iv,
        BufferView pt,
        BufferMut ct_out,
        u32* ct_len) noexcept;

    // Padding failures come back as Crypto/Crypto with no further detail.
    // pt_out.len must be >= ct.len.
    touchseal::core::Status cbc_decrypt(const Key256& key,
        const Iv16& iv,
        BufferView ct,
        BufferMut pt_out,
        u32* pt_len) noexcept;

    touchseal::core::Status hmac_sha256(const Key256& key,
        const BufferView* parts,
        u32 part_count,
        Tag32* out) noexcept;

    [[nodiscard]] bool tag32_equal_ct(const Tag32& a, const Tag32& b) noexcept;

    // Cryptographically secure random bytes from the system source.
    touchseal::core::Status random_bytes(BufferMut out) noexcept;

    using RandomFn = touchseal::core::Status (*)(void* ctx, BufferMut out) noexcept;

    // Injectable random source; a null fill means random_bytes().
    struct RandomSource {
        RandomFn fill{nullptr};
        void* ctx{nullptr};
    };

    touchseal::core::Status random_fill(const RandomSource& src, BufferMut out) noexcept;

    void secure_wipe(void* p, std::size_t n) noexcept;

    static_assert(std::is_trivially_copyable_v<Key256>);
    static_assert(std::is_trivially_copyable_v<Iv16>);
    static_assert(std::is_trivially_copyable_v<Tag32>);
    static_assert(std::is_trivially_copyable_v<RandomSource>);

} // namespace touchseal::security
