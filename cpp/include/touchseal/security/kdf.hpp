#pragma once

#include "touchseal/core/errors.hpp"
#include "touchseal/security/crypto.hpp"
#include "touchseal/security/hashing.hpp"

namespace touchseal::security {

    // key = H(H(signature || challenge || fingerprint)).
    // Order is fixed; encrypt and decrypt must agree on it and on `hash`.
    // Any empty input is Crypto/Empty and leaves *out_key untouched.
    touchseal::core::Status derive_key(HashId hash,
        BufferView signature,
        BufferView challenge,
        BufferView fingerprint,
        Key256* out_key) noexcept;

    // Envelope authentication subkey: HMAC-SHA256(key, "touchseal.kdf.mac.v1").
    touchseal::core::Status derive_mac_key(const Key256& key, Key256* out_key) noexcept;

} // namespace touchseal::security
