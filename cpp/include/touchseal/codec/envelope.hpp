#pragma once

#include <string>
#include <string_view>

#include "touchseal/core/errors.hpp"

namespace touchseal::codec {

    inline constexpr char kEnvelopeDelimiter = ':';

    // Textual fields of `challenge:iv:ciphertext`. The codec does not look
    // inside the fields beyond the delimiter and printable-text rules.
    struct Envelope {
        std::string challenge;
        std::string iv;
        std::string ciphertext;

        friend bool operator==(const Envelope&, const Envelope&) = default;
    };

    // Fails with Input/Invalid if a field is empty, if challenge or iv holds
    // the delimiter, or if any field holds a control character.
    touchseal::core::Status envelope_encode(const Envelope& env, std::string* out);

    // Splits on the first two delimiters only; the ciphertext runs to the end.
    // Fewer than three parts, an empty part or a control character is Input/Format.
    touchseal::core::Status envelope_decode(std::string_view text, Envelope* out);

} // namespace touchseal::codec
