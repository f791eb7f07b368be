#include "touchseal/security/kdf.hpp"

#include <cstring>

namespace touchseal::security {
    touchseal::core::Status derive_key(HashId hash,
        BufferView signature,
        BufferView challenge,
        BufferView fingerprint,
        Key256* out_key) noexcept {
        if (out_key == nullptr) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Crypto, touchseal::core::StatusCode::Invalid);
        }
        if (!touchseal::core::buffer_ok(signature) || !touchseal::core::buffer_ok(challenge) ||
            !touchseal::core::buffer_ok(fingerprint)) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Crypto, touchseal::core::StatusCode::Invalid);
        }
        if (signature.len == 0 || challenge.len == 0 || fingerprint.len == 0) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Crypto, touchseal::core::StatusCode::Empty);
        }

        const BufferView parts[3] = {signature, challenge, fingerprint};
        Digest256 inner{};
        touchseal::core::Status s = hash_compute(hash, parts, 3, &inner);
        if (!touchseal::core::is_ok(s)) {
            return s;
        }

        Digest256 outer{};
        s = hash_compute(hash, BufferView{inner.b.data(), static_cast<u32>(inner.b.size())}, &outer);
        secure_wipe(inner.b.data(), inner.b.size());
        if (!touchseal::core::is_ok(s)) {
            return s;
        }

        std::memcpy(out_key->b, outer.b.data(), sizeof(out_key->b));
        secure_wipe(outer.b.data(), outer.b.size());
        return touchseal::core::ok_status();
    }

    touchseal::core::Status derive_mac_key(const Key256& key, Key256* out_key) noexcept {
        if (out_key == nullptr) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Crypto, touchseal::core::StatusCode::Invalid);
        }

        static constexpr char kLabel[] = "touchseal.kdf.mac.v1";
        const BufferView label = touchseal::core::view_of(kLabel, sizeof(kLabel) - 1);

        Tag32 t{};
        const touchseal::core::Status s = hmac_sha256(key, &label, 1, &t);
        if (!touchseal::core::is_ok(s)) {
            return s;
        }
        std::memcpy(out_key->b, t.b, sizeof(out_key->b));
        secure_wipe(t.b, sizeof(t.b));
        return touchseal::core::ok_status();
    }
} // namespace touchseal::security
