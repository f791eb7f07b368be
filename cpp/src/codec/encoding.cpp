#include "touchseal/codec/encoding.hpp"

#include <cstddef>
#include <utility>

#include <openssl/evp.h>

namespace touchseal::codec {
    namespace {
        [[nodiscard]] touchseal::core::Status format_error() noexcept {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Input, touchseal::core::StatusCode::Format);
        }

        [[nodiscard]] bool is_b64_std_char(char c) noexcept {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
        }

        [[nodiscard]] bool is_b64_url_char(char c) noexcept {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
        }

        // Index in the standard alphabet; callers validate the character first.
        [[nodiscard]] int b64_value(char c) noexcept {
            if (c >= 'A' && c <= 'Z') return c - 'A';
            if (c >= 'a' && c <= 'z') return c - 'a' + 26;
            if (c >= '0' && c <= '9') return c - '0' + 52;
            if (c == '+') return 62;
            if (c == '/') return 63;
            return -1;
        }

        [[nodiscard]] int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    } // namespace

    touchseal::core::Status base64_encode(BufferView in, Base64Variant v, std::string* out) {
        if (out == nullptr || !touchseal::core::buffer_ok(in)) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Input, touchseal::core::StatusCode::Invalid);
        }
        out->clear();
        if (in.len == 0) {
            return touchseal::core::ok_status();
        }

        // EVP_EncodeBlock writes a NUL terminator after the padded output.
        std::string buf(static_cast<size_t>(base64_encoded_len(in.len, Base64Variant::Standard)) + 1, '\0');
        const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(buf.data()), in.data, static_cast<int>(in.len));
        if (n < 0) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Input, touchseal::core::StatusCode::Invalid);
        }
        buf.resize(static_cast<size_t>(n));

        if (v != Base64Variant::Standard) {
            while (!buf.empty() && buf.back() == '=') {
                buf.pop_back();
            }
        }
        if (v == Base64Variant::UrlNoPad) {
            for (char& c : buf) {
                if (c == '+') {
                    c = '-';
                } else if (c == '/') {
                    c = '_';
                }
            }
        }

        *out = std::move(buf);
        return touchseal::core::ok_status();
    }

    touchseal::core::Status base64_decode(std::string_view in, Base64Variant v, std::vector<u8>* out) {
        if (out == nullptr) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Input, touchseal::core::StatusCode::Invalid);
        }
        out->clear();
        if (in.empty()) {
            return touchseal::core::ok_status();
        }

        std::string norm;
        norm.reserve(in.size() + 2);
        size_t pad = 0;

        if (v == Base64Variant::Standard) {
            if ((in.size() % 4) != 0) {
                return format_error();
            }
            for (size_t i = 0; i < in.size(); ++i) {
                const char c = in[i];
                if (c == '=') {
                    ++pad;
                    continue;
                }
                if (pad > 0 || !is_b64_std_char(c)) {
                    return format_error();
                }
            }
            if (pad > 2) {
                return format_error();
            }
            norm.assign(in.data(), in.size());
        } else {
            if ((in.size() % 4) == 1) {
                return format_error();
            }
            const bool url = (v == Base64Variant::UrlNoPad);
            for (const char c : in) {
                if (url) {
                    if (!is_b64_url_char(c)) {
                        return format_error();
                    }
                    norm.push_back(c == '-' ? '+' : (c == '_' ? '/' : c));
                } else {
                    if (!is_b64_std_char(c)) {
                        return format_error();
                    }
                    norm.push_back(c);
                }
            }
            pad = (4 - (norm.size() % 4)) % 4;
            norm.append(pad, '=');
        }

        // The last data character carries 2 (one pad) or 4 (two pads) unused
        // bits that must be zero, otherwise two texts decode to the same bytes.
        if (pad > 0) {
            const int last = b64_value(norm[norm.size() - pad - 1]);
            const int unused_mask = (pad == 1) ? 0x3 : 0xF;
            if (last < 0 || (last & unused_mask) != 0) {
                return format_error();
            }
        }

        std::vector<u8> buf((norm.size() / 4) * 3);
        const int n = EVP_DecodeBlock(buf.data(), reinterpret_cast<const unsigned char*>(norm.data()), static_cast<int>(norm.size()));
        if (n < 0 || static_cast<size_t>(n) != buf.size() || buf.size() < pad) {
            return format_error();
        }
        buf.resize(buf.size() - pad);

        *out = std::move(buf);
        return touchseal::core::ok_status();
    }

    touchseal::core::Status hex_encode(BufferView in, std::string* out) {
        if (out == nullptr || !touchseal::core::buffer_ok(in)) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Input, touchseal::core::StatusCode::Invalid);
        }
        static const char hex[] = "0123456789abcdef";
        out->clear();
        out->reserve(static_cast<size_t>(in.len) * 2);
        for (u32 i = 0; i < in.len; ++i) {
            out->push_back(hex[(in.data[i] >> 4) & 0xF]);
            out->push_back(hex[in.data[i] & 0xF]);
        }
        return touchseal::core::ok_status();
    }

    touchseal::core::Status hex_decode(std::string_view in, BufferMut out) noexcept {
        if (!touchseal::core::buffer_ok(out)) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Input, touchseal::core::StatusCode::Invalid);
        }
        if (in.size() != static_cast<size_t>(out.len) * 2) {
            return format_error();
        }
        for (u32 i = 0; i < out.len; ++i) {
            const int hi = hex_value(in[2 * i]);
            const int lo = hex_value(in[2 * i + 1]);
            if (hi < 0 || lo < 0) {
                return format_error();
            }
            out.data[i] = static_cast<u8>((hi << 4) | lo);
        }
        return touchseal::core::ok_status();
    }
} // namespace touchseal::codec
