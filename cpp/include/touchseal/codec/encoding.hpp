#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "touchseal/core/errors.hpp"
#include "touchseal/core/types.hpp"

namespace touchseal::codec {
    using u8 = touchseal::core::u8;
    using u32 = touchseal::core::u32;
    using BufferView = touchseal::core::BufferView;
    using BufferMut = touchseal::core::BufferMut;

    enum class Base64Variant : u8 {
        Standard = 0,      // RFC 4648 section 4, padded
        StandardNoPad = 1, // OpenSSH fingerprints
        UrlNoPad = 2,      // RFC 4648 section 5, unpadded; never contains ':'
    };

    [[nodiscard]] constexpr u32 base64_encoded_len(u32 n, Base64Variant v) noexcept {
        if (v == Base64Variant::Standard) {
            return ((n + 2) / 3) * 4;
        }
        return (n / 3) * 4 + ((n % 3) == 0 ? 0 : (n % 3) + 1);
    }

    touchseal::core::Status base64_encode(BufferView in, Base64Variant v, std::string* out);

    // Strict: rejects characters outside the variant's alphabet, misplaced
    // padding, impossible lengths and non-zero trailing bits with Input/Format,
    // so every byte string has exactly one accepted encoding.
    touchseal::core::Status base64_decode(std::string_view in, Base64Variant v, std::vector<u8>* out);

    touchseal::core::Status hex_encode(BufferView in, std::string* out);

    // Decodes exactly out.len bytes; any other input length is Input/Format.
    touchseal::core::Status hex_decode(std::string_view in, BufferMut out) noexcept;

} // namespace touchseal::codec
