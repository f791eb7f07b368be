#include "touchseal/credential/credential.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

#include <sys/stat.h>
#include <unistd.h>

#include "touchseal/codec/encoding.hpp"
#include "touchseal/codec/ssh_wire.hpp"
#include "touchseal/security/hashing.hpp"

namespace touchseal::credential {
    namespace {
        using touchseal::core::Status;
        using touchseal::core::StatusCode;
        using touchseal::core::StatusDomain;

        struct KeyTypeInfo {
            const char* name;
            SignatureScheme scheme;
            bool hardware;
        };

        constexpr KeyTypeInfo kKeyTypes[] = {
            {"sk-ssh-ed25519@openssh.com", SignatureScheme::Ed25519, true},
            {"sk-ecdsa-sha2-nistp256@openssh.com", SignatureScheme::Ecdsa, true},
            {"ssh-ed25519", SignatureScheme::Ed25519, false},
            {"ecdsa-sha2-nistp256", SignatureScheme::Ecdsa, false},
            {"ecdsa-sha2-nistp384", SignatureScheme::Ecdsa, false},
            {"ecdsa-sha2-nistp521", SignatureScheme::Ecdsa, false},
            {"ssh-rsa", SignatureScheme::Rsa, false},
        };

        constexpr std::size_t kMaxPublicKeyFileBytes = 64 * 1024;

        [[nodiscard]] Status cred_status(StatusCode code, touchseal::core::u32 aux = 0) noexcept {
            return touchseal::core::make_status(StatusDomain::Credential, code, aux);
        }

        [[nodiscard]] const KeyTypeInfo* find_key_type(std::string_view name) noexcept {
            for (const KeyTypeInfo& k : kKeyTypes) {
                if (name == k.name) {
                    return &k;
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool is_space(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\r' || c == '\n';
        }

        [[nodiscard]] std::string_view trim(std::string_view s) noexcept {
            while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
            while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
            return s;
        }

        [[nodiscard]] std::string_view next_token(std::string_view* s) noexcept {
            *s = trim(*s);
            std::size_t n = 0;
            while (n < s->size() && !is_space((*s)[n])) ++n;
            const std::string_view tok = s->substr(0, n);
            s->remove_prefix(n);
            return tok;
        }

        // Walks the key-specific fields after the type string.
        Status parse_blob_body(const KeyTypeInfo& info, touchseal::codec::SshReader* r, Credential* out) {
            touchseal::codec::BufferView field{};

            if (info.scheme == SignatureScheme::Ed25519) {
                if (!touchseal::core::is_ok(touchseal::codec::ssh_read_string(r, &field)) || field.len != 32) {
                    return cred_status(StatusCode::InvalidFormat);
                }
            } else if (info.scheme == SignatureScheme::Ecdsa) {
                touchseal::codec::BufferView curve{};
                if (!touchseal::core::is_ok(touchseal::codec::ssh_read_string(r, &curve)) ||
                    !touchseal::core::is_ok(touchseal::codec::ssh_read_string(r, &field)) || field.len == 0) {
                    return cred_status(StatusCode::InvalidFormat);
                }
                // "ecdsa-sha2-<curve>" and "sk-ecdsa-sha2-<curve>@openssh.com" both carry the curve name.
                if (std::string_view(info.name).find(touchseal::codec::ssh_as_text(curve)) == std::string_view::npos) {
                    return cred_status(StatusCode::InvalidFormat);
                }
            } else {
                touchseal::codec::BufferView e{};
                if (!touchseal::core::is_ok(touchseal::codec::ssh_read_string(r, &e)) ||
                    !touchseal::core::is_ok(touchseal::codec::ssh_read_string(r, &field)) || e.len == 0 || field.len == 0) {
                    return cred_status(StatusCode::InvalidFormat);
                }
            }

            if (info.hardware) {
                touchseal::codec::BufferView app{};
                if (!touchseal::core::is_ok(touchseal::codec::ssh_read_string(r, &app)) || app.len == 0) {
                    return cred_status(StatusCode::InvalidFormat);
                }
                out->application.assign(touchseal::codec::ssh_as_text(app));
            }

            if (!touchseal::codec::ssh_reader_done(*r)) {
                return cred_status(StatusCode::InvalidFormat);
            }
            return touchseal::core::ok_status();
        }

        Status read_text_file(const std::string& path, std::string* out) {
            errno = 0;
            FILE* f = std::fopen(path.c_str(), "rb");
            if (!f) {
                const int err = errno;
                if (err == ENOENT || err == ENOTDIR) {
                    return cred_status(StatusCode::NotFound, static_cast<touchseal::core::u32>(err));
                }
                return cred_status(StatusCode::Unreadable, static_cast<touchseal::core::u32>(err));
            }

            std::string buf;
            char chunk[4096];
            bool too_big = false;
            for (;;) {
                const std::size_t n = std::fread(chunk, 1, sizeof(chunk), f);
                if (n > 0) {
                    buf.append(chunk, n);
                }
                if (buf.size() > kMaxPublicKeyFileBytes) {
                    too_big = true;
                    break;
                }
                if (n < sizeof(chunk)) {
                    break;
                }
            }
            const bool read_error = std::ferror(f) != 0;
            std::fclose(f);

            if (read_error) {
                return cred_status(StatusCode::Unreadable, static_cast<touchseal::core::u32>(EIO));
            }
            if (too_big) {
                return cred_status(StatusCode::InvalidFormat);
            }
            *out = std::move(buf);
            return touchseal::core::ok_status();
        }

        Status check_private_key(const std::string& path) noexcept {
            struct stat st {};
            if (::stat(path.c_str(), &st) != 0) {
                const int err = errno;
                if (err == ENOENT || err == ENOTDIR) {
                    return cred_status(StatusCode::NotFound, static_cast<touchseal::core::u32>(err));
                }
                return cred_status(StatusCode::Unreadable, static_cast<touchseal::core::u32>(err));
            }
            if (!S_ISREG(st.st_mode)) {
                return cred_status(StatusCode::Unreadable);
            }
            if (::access(path.c_str(), R_OK) != 0) {
                return cred_status(StatusCode::Unreadable, static_cast<touchseal::core::u32>(errno));
            }
            return touchseal::core::ok_status();
        }
    } // namespace

    Status fingerprint_compute(BufferView public_blob, std::string* out) {
        if (out == nullptr || public_blob.len == 0 || !touchseal::core::buffer_ok(public_blob)) {
            return cred_status(StatusCode::Invalid);
        }

        touchseal::security::Digest256 d{};
        const Status s = touchseal::security::hash_compute(touchseal::security::HashId::Sha256, public_blob, &d);
        if (!touchseal::core::is_ok(s)) {
            return s;
        }

        std::string b64;
        const Status e = touchseal::codec::base64_encode(
            BufferView{d.b.data(), static_cast<touchseal::core::u32>(d.b.size())},
            touchseal::codec::Base64Variant::StandardNoPad,
            &b64);
        if (!touchseal::core::is_ok(e)) {
            return e;
        }

        *out = "SHA256:" + b64;
        return touchseal::core::ok_status();
    }

    Status parse_public_key_line(std::string_view line, Credential* out) {
        if (out == nullptr) {
            return cred_status(StatusCode::Invalid);
        }

        std::string_view rest = line;
        const std::string_view type = next_token(&rest);
        const std::string_view blob_b64 = next_token(&rest);
        const std::string_view comment = trim(rest);

        if (type.empty() || blob_b64.empty()) {
            return cred_status(StatusCode::InvalidFormat);
        }
        const KeyTypeInfo* info = find_key_type(type);
        if (info == nullptr) {
            return cred_status(StatusCode::InvalidFormat);
        }

        std::vector<u8> blob;
        if (!touchseal::core::is_ok(touchseal::codec::base64_decode(blob_b64, touchseal::codec::Base64Variant::Standard, &blob)) ||
            blob.empty()) {
            return cred_status(StatusCode::InvalidFormat);
        }

        Credential c{};
        touchseal::codec::SshReader r{touchseal::core::view_of(blob), 0};
        touchseal::codec::BufferView embedded{};
        if (!touchseal::core::is_ok(touchseal::codec::ssh_read_string(&r, &embedded)) ||
            touchseal::codec::ssh_as_text(embedded) != type) {
            return cred_status(StatusCode::InvalidFormat);
        }
        const Status body = parse_blob_body(*info, &r, &c);
        if (!touchseal::core::is_ok(body)) {
            return body;
        }

        const Status fp = fingerprint_compute(touchseal::core::view_of(blob), &c.fingerprint);
        if (!touchseal::core::is_ok(fp)) {
            return fp;
        }

        c.key_type.assign(type);
        c.comment.assign(comment);
        c.public_blob = std::move(blob);
        c.scheme = info->scheme;
        c.hardware_backed = info->hardware;

        *out = std::move(c);
        return touchseal::core::ok_status();
    }

    Status credential_load(const char* key_path, Credential* out) {
        if (out == nullptr) {
            return cred_status(StatusCode::Invalid);
        }
        if (key_path == nullptr || key_path[0] == '\0') {
            return cred_status(StatusCode::NotFound);
        }

        static constexpr std::string_view kPubSuffix = ".pub";
        std::string priv_path(key_path);
        std::string pub_path;
        if (priv_path.size() > kPubSuffix.size() &&
            std::string_view(priv_path).substr(priv_path.size() - kPubSuffix.size()) == kPubSuffix) {
            pub_path = priv_path;
            priv_path.resize(priv_path.size() - kPubSuffix.size());
        } else {
            pub_path = priv_path + std::string(kPubSuffix);
        }

        Status s = check_private_key(priv_path);
        if (!touchseal::core::is_ok(s)) {
            return s;
        }

        std::string text;
        s = read_text_file(pub_path, &text);
        if (!touchseal::core::is_ok(s)) {
            return s;
        }

        // First line that is neither blank nor a comment.
        std::string_view remaining(text);
        std::string_view line;
        while (!remaining.empty()) {
            const std::size_t nl = remaining.find('\n');
            const std::string_view candidate = trim(remaining.substr(0, nl));
            remaining = (nl == std::string_view::npos) ? std::string_view{} : remaining.substr(nl + 1);
            if (!candidate.empty() && candidate.front() != '#') {
                line = candidate;
                break;
            }
        }
        if (line.empty()) {
            return cred_status(StatusCode::InvalidFormat);
        }

        Credential c{};
        s = parse_public_key_line(line, &c);
        if (!touchseal::core::is_ok(s)) {
            return s;
        }
        if (!c.hardware_backed) {
            return cred_status(StatusCode::NotHardwareBacked);
        }

        c.key_path = std::move(priv_path);
        *out = std::move(c);
        return touchseal::core::ok_status();
    }

    Status credential_check(const Credential& cred, bool allow_nondeterministic) noexcept {
        if (!cred.hardware_backed) {
            return cred_status(StatusCode::NotHardwareBacked);
        }
        if (cred.fingerprint.empty()) {
            return cred_status(StatusCode::InvalidFormat);
        }
        // Only the algorithm is checked here. The authenticator counter is only
        // visible after a touch, so it is left to the round trip.
        if (!allow_nondeterministic && !scheme_is_deterministic(cred.scheme)) {
            return cred_status(StatusCode::Unsupported);
        }
        return touchseal::core::ok_status();
    }
} // namespace touchseal::credential
