#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "touchseal/core/errors.hpp"
#include "touchseal/core/types.hpp"

namespace touchseal::credential {
    using u8 = touchseal::core::u8;
    using BufferView = touchseal::core::BufferView;

    enum class SignatureScheme : u8 {
        Unknown = 0,
        Ed25519 = 1,
        Ecdsa = 2,
        Rsa = 3,
    };

    // Loaded once per invocation; never written back or cached.
    struct Credential {
        std::string key_path;          // private key file handed to the signer
        std::string key_type;          // e.g. "sk-ssh-ed25519@openssh.com"
        std::string application;       // FIDO application string, "ssh:" by default
        std::string comment;
        std::vector<u8> public_blob;   // RFC 4253 public key blob
        std::string fingerprint;       // "SHA256:<base64>" as printed by ssh-keygen -l
        SignatureScheme scheme{SignatureScheme::Unknown};
        bool hardware_backed{false};
    };

    // Whether the signature algorithm itself is deterministic. Plain ECDSA
    // draws a fresh nonce per signature, so a re-signed challenge never
    // reproduces the same key. For sk- keys this is necessary but not
    // sufficient: the authenticator also signs its flags and signature
    // counter, so a token that advances the counter yields a different key on
    // every touch and decrypt fails with the generic error.
    [[nodiscard]] constexpr bool scheme_is_deterministic(SignatureScheme s) noexcept {
        return s == SignatureScheme::Ed25519 || s == SignatureScheme::Rsa;
    }

    // OpenSSH fingerprint of a public key blob: "SHA256:" + unpadded base64 of SHA-256(blob).
    touchseal::core::Status fingerprint_compute(BufferView public_blob, std::string* out);

    // Parses one OpenSSH public key line ("<type> <base64 blob> [comment]").
    // Fills everything but key_path. Unknown or inconsistent keys are Credential/InvalidFormat.
    touchseal::core::Status parse_public_key_line(std::string_view line, Credential* out);

    // `key_path` names the private key or its ".pub" companion. The private
    // key must exist and be readable; the public half is parsed from "<key>.pub".
    // Fails with Credential/{NotFound, Unreadable, InvalidFormat, NotHardwareBacked}.
    touchseal::core::Status credential_load(const char* key_path, Credential* out);

    // Gate applied before any cryptographic work. Passing it does not prove the
    // token re-signs identically; see scheme_is_deterministic.
    touchseal::core::Status credential_check(const Credential& cred, bool allow_nondeterministic) noexcept;

    [[nodiscard]] inline BufferView credential_fingerprint(const Credential& cred) noexcept {
        return touchseal::core::view_of(cred.fingerprint);
    }

} // namespace touchseal::credential
