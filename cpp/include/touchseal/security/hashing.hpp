#pragma once

#include <array>

#include "touchseal/core/errors.hpp"
#include "touchseal/core/types.hpp"

namespace touchseal::security {
    using u8 = touchseal::core::u8;
    using u32 = touchseal::core::u32;
    using BufferView = touchseal::core::BufferView;

    enum class HashId : u8 {
        Sha256 = 1,
        Blake3 = 2,
    };

    struct Digest256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(const Digest256&, const Digest256&) noexcept = default;
    };
    static_assert(sizeof(Digest256) == 32);

    // One-shot digest over the concatenation of `parts`. Empty parts are allowed.
    touchseal::core::Status hash_compute(HashId hash,
        const BufferView* parts,
        u32 part_count,
        Digest256* out) noexcept;

    [[nodiscard]] inline touchseal::core::Status hash_compute(HashId hash, BufferView data, Digest256* out) noexcept {
        return hash_compute(hash, &data, 1, out);
    }

    [[nodiscard]] constexpr const char* hash_name(HashId hash) noexcept {
        switch (hash) {
        case HashId::Sha256: return "sha256";
        case HashId::Blake3: return "blake3";
        }
        return "unknown";
    }

} // namespace touchseal::security
