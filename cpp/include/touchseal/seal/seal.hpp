#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "touchseal/core/errors.hpp"
#include "touchseal/core/types.hpp"
#include "touchseal/credential/credential.hpp"
#include "touchseal/oracle/oracle.hpp"
#include "touchseal/security/crypto.hpp"
#include "touchseal/security/hashing.hpp"

namespace touchseal::seal {
    using u8 = touchseal::core::u8;
    using u32 = touchseal::core::u32;
    using BufferView = touchseal::core::BufferView;

    inline constexpr u32 kChallengeBytes = 32;
    inline constexpr u32 kIvBytes = 16;
    inline constexpr u32 kTagBytes = 32;

    // Both ends of an envelope must use the same kdf_hash.
    struct SealConfig {
        touchseal::security::HashId kdf_hash{touchseal::security::HashId::Sha256};
        bool allow_nondeterministic{false};
        touchseal::security::RandomSource random{};
    };

    // Produces "challenge:iv:ciphertext". Exactly one oracle call per success
    // or oracle failure; empty plaintext and rejected credentials fail before it.
    touchseal::core::Status seal_encrypt(BufferView plaintext,
        const touchseal::credential::Credential& cred,
        const touchseal::oracle::SigningOracle& oracle,
        const SealConfig& cfg,
        std::string* envelope_out);

    // Structural problems are Input/Format and never reach the oracle. Every
    // failure after that point other than an oracle failure is the same
    // Crypto/Crypto status: wrong key, tampering and bad padding look alike.
    touchseal::core::Status seal_decrypt(std::string_view envelope_text,
        const touchseal::credential::Credential& cred,
        const touchseal::oracle::SigningOracle& oracle,
        const SealConfig& cfg,
        std::vector<u8>* plaintext_out);

} // namespace touchseal::seal
