#include "touchseal/codec/envelope.hpp"

#include <cstddef>
#include <utility>

namespace touchseal::codec {
    namespace {
        [[nodiscard]] bool has_control_char(std::string_view s) noexcept {
            for (const char c : s) {
                const unsigned char u = static_cast<unsigned char>(c);
                if (u < 0x20 || u == 0x7f) {
                    return true;
                }
            }
            return false;
        }

        [[nodiscard]] bool field_ok(std::string_view s, bool allow_delimiter) noexcept {
            if (s.empty() || has_control_char(s)) {
                return false;
            }
            return allow_delimiter || s.find(kEnvelopeDelimiter) == std::string_view::npos;
        }
    } // namespace

    touchseal::core::Status envelope_encode(const Envelope& env, std::string* out) {
        if (out == nullptr) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Input, touchseal::core::StatusCode::Invalid);
        }
        if (!field_ok(env.challenge, false) || !field_ok(env.iv, false) || !field_ok(env.ciphertext, true)) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Input, touchseal::core::StatusCode::Invalid);
        }

        std::string s;
        s.reserve(env.challenge.size() + env.iv.size() + env.ciphertext.size() + 2);
        s.append(env.challenge);
        s.push_back(kEnvelopeDelimiter);
        s.append(env.iv);
        s.push_back(kEnvelopeDelimiter);
        s.append(env.ciphertext);

        *out = std::move(s);
        return touchseal::core::ok_status();
    }

    touchseal::core::Status envelope_decode(std::string_view text, Envelope* out) {
        if (out == nullptr) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Input, touchseal::core::StatusCode::Invalid);
        }

        const size_t first = text.find(kEnvelopeDelimiter);
        if (first == std::string_view::npos) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Input, touchseal::core::StatusCode::Format);
        }
        const size_t second = text.find(kEnvelopeDelimiter, first + 1);
        if (second == std::string_view::npos) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Input, touchseal::core::StatusCode::Format);
        }

        const std::string_view challenge = text.substr(0, first);
        const std::string_view iv = text.substr(first + 1, second - first - 1);
        const std::string_view ciphertext = text.substr(second + 1);

        if (!field_ok(challenge, false) || !field_ok(iv, false) || !field_ok(ciphertext, true)) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Input, touchseal::core::StatusCode::Format);
        }

        out->challenge.assign(challenge);
        out->iv.assign(iv);
        out->ciphertext.assign(ciphertext);
        return touchseal::core::ok_status();
    }
} // namespace touchseal::codec
