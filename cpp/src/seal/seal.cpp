#include "touchseal/seal/seal.hpp"

#include <cstdint>
#include <cstring>
#include <utility>

#include "touchseal/codec/encoding.hpp"
#include "touchseal/codec/envelope.hpp"
#include "touchseal/security/kdf.hpp"

namespace touchseal::seal {
    namespace {
        using touchseal::core::Status;
        using touchseal::core::StatusCode;
        using touchseal::core::StatusDomain;
        namespace sec = touchseal::security;

        [[nodiscard]] Status decrypt_failed() noexcept {
            return touchseal::core::make_status(StatusDomain::Crypto, StatusCode::Crypto);
        }

        struct KeyMaterial {
            sec::Key256 enc{};
            sec::Key256 mac{};

            ~KeyMaterial() {
                sec::secure_wipe(enc.b, sizeof(enc.b));
                sec::secure_wipe(mac.b, sizeof(mac.b));
            }
        };

        struct WipedBytes {
            std::vector<u8> b;

            ~WipedBytes() {
                sec::secure_wipe(b.data(), b.size());
            }
        };

        void put_u32_be(u8 out[4], u32 v) noexcept {
            out[0] = static_cast<u8>((v >> 24) & 0xffu);
            out[1] = static_cast<u8>((v >> 16) & 0xffu);
            out[2] = static_cast<u8>((v >> 8) & 0xffu);
            out[3] = static_cast<u8>((v >> 0) & 0xffu);
        }

        // Signs the challenge and derives both keys from the signature.
        Status derive_keys(std::string_view challenge,
            const touchseal::credential::Credential& cred,
            const touchseal::oracle::SigningOracle& oracle,
            const SealConfig& cfg,
            KeyMaterial* keys) {
            const BufferView challenge_view = touchseal::core::view_of(challenge.data(), challenge.size());

            WipedBytes signature;
            Status s = touchseal::oracle::oracle_sign(oracle, challenge_view, cred, &signature.b);
            if (!touchseal::core::is_ok(s)) {
                return s;
            }

            s = sec::derive_key(cfg.kdf_hash,
                touchseal::core::view_of(signature.b),
                challenge_view,
                touchseal::credential::credential_fingerprint(cred),
                &keys->enc);
            if (!touchseal::core::is_ok(s)) {
                return s;
            }
            return sec::derive_mac_key(keys->enc, &keys->mac);
        }

        Status envelope_tag(const sec::Key256& mac_key,
            std::string_view challenge,
            const sec::Iv16& iv,
            BufferView ct,
            sec::Tag32* out) noexcept {
            static constexpr char kLabel[] = "touchseal.envelope.v1";
            u8 challenge_len[4];
            put_u32_be(challenge_len, static_cast<u32>(challenge.size()));

            const BufferView parts[] = {
                touchseal::core::view_of(kLabel, sizeof(kLabel) - 1),
                BufferView{challenge_len, 4},
                touchseal::core::view_of(challenge.data(), challenge.size()),
                BufferView{iv.b, kIvBytes},
                ct,
            };
            return sec::hmac_sha256(mac_key, parts, static_cast<u32>(sizeof(parts) / sizeof(parts[0])), out);
        }
    } // namespace

    Status seal_encrypt(BufferView plaintext,
        const touchseal::credential::Credential& cred,
        const touchseal::oracle::SigningOracle& oracle,
        const SealConfig& cfg,
        std::string* envelope_out) {
        if (envelope_out == nullptr || !touchseal::core::buffer_ok(plaintext)) {
            return touchseal::core::make_status(StatusDomain::Input, StatusCode::Invalid);
        }
        if (plaintext.len == 0) {
            return touchseal::core::make_status(StatusDomain::Input, StatusCode::Empty);
        }
        if (plaintext.len > UINT32_MAX - sec::kCbcBlockBytes - kTagBytes) {
            return touchseal::core::make_status(StatusDomain::Input, StatusCode::Invalid);
        }

        Status s = touchseal::credential::credential_check(cred, cfg.allow_nondeterministic);
        if (!touchseal::core::is_ok(s)) {
            return s;
        }

        u8 challenge_raw[kChallengeBytes];
        s = sec::random_fill(cfg.random, touchseal::core::BufferMut{challenge_raw, kChallengeBytes});
        if (!touchseal::core::is_ok(s)) {
            return s;
        }
        touchseal::codec::Envelope env;
        s = touchseal::codec::base64_encode(BufferView{challenge_raw, kChallengeBytes},
            touchseal::codec::Base64Variant::UrlNoPad,
            &env.challenge);
        if (!touchseal::core::is_ok(s)) {
            return s;
        }

        KeyMaterial keys;
        s = derive_keys(env.challenge, cred, oracle, cfg, &keys);
        if (!touchseal::core::is_ok(s)) {
            return s;
        }

        sec::Iv16 iv{};
        s = sec::random_fill(cfg.random, touchseal::core::BufferMut{iv.b, kIvBytes});
        if (!touchseal::core::is_ok(s)) {
            return s;
        }

        const u32 ct_cap = sec::cbc_ciphertext_len(plaintext.len);
        std::vector<u8> sealed(static_cast<std::size_t>(ct_cap) + kTagBytes);
        u32 ct_len = 0;
        s = sec::cbc_encrypt(keys.enc, iv, plaintext, touchseal::core::BufferMut{sealed.data(), ct_cap}, &ct_len);
        if (!touchseal::core::is_ok(s)) {
            return s;
        }

        sec::Tag32 tag{};
        s = envelope_tag(keys.mac, env.challenge, iv, BufferView{sealed.data(), ct_len}, &tag);
        if (!touchseal::core::is_ok(s)) {
            return s;
        }
        std::memcpy(sealed.data() + ct_len, tag.b, kTagBytes);
        sealed.resize(static_cast<std::size_t>(ct_len) + kTagBytes);

        s = touchseal::codec::hex_encode(BufferView{iv.b, kIvBytes}, &env.iv);
        if (!touchseal::core::is_ok(s)) {
            return s;
        }
        s = touchseal::codec::base64_encode(touchseal::core::view_of(sealed),
            touchseal::codec::Base64Variant::Standard,
            &env.ciphertext);
        if (!touchseal::core::is_ok(s)) {
            return s;
        }

        return touchseal::codec::envelope_encode(env, envelope_out);
    }

    Status seal_decrypt(std::string_view envelope_text,
        const touchseal::credential::Credential& cred,
        const touchseal::oracle::SigningOracle& oracle,
        const SealConfig& cfg,
        std::vector<u8>* plaintext_out) {
        if (plaintext_out == nullptr) {
            return touchseal::core::make_status(StatusDomain::Input, StatusCode::Invalid);
        }
        plaintext_out->clear();

        Status s = touchseal::credential::credential_check(cred, cfg.allow_nondeterministic);
        if (!touchseal::core::is_ok(s)) {
            return s;
        }

        touchseal::codec::Envelope env;
        s = touchseal::codec::envelope_decode(envelope_text, &env);
        if (!touchseal::core::is_ok(s)) {
            return s;
        }

        sec::Iv16 iv{};
        s = touchseal::codec::hex_decode(env.iv, touchseal::core::BufferMut{iv.b, kIvBytes});
        if (!touchseal::core::is_ok(s)) {
            return s;
        }

        std::vector<u8> sealed;
        if (!touchseal::core::is_ok(touchseal::codec::base64_decode(env.ciphertext,
                touchseal::codec::Base64Variant::Standard,
                &sealed))) {
            return decrypt_failed();
        }
        if (sealed.size() < sec::kCbcBlockBytes + kTagBytes ||
            ((sealed.size() - kTagBytes) % sec::kCbcBlockBytes) != 0 ||
            sealed.size() > UINT32_MAX) {
            return decrypt_failed();
        }
        const u32 ct_len = static_cast<u32>(sealed.size() - kTagBytes);
        const BufferView ct{sealed.data(), ct_len};

        KeyMaterial keys;
        s = derive_keys(env.challenge, cred, oracle, cfg, &keys);
        if (!touchseal::core::is_ok(s)) {
            if (s.domain == StatusDomain::Oracle) {
                return s;
            }
            return decrypt_failed();
        }

        sec::Tag32 expected{};
        sec::Tag32 got{};
        std::memcpy(got.b, sealed.data() + ct_len, kTagBytes);
        if (!touchseal::core::is_ok(envelope_tag(keys.mac, env.challenge, iv, ct, &expected)) ||
            !sec::tag32_equal_ct(expected, got)) {
            return decrypt_failed();
        }

        WipedBytes pt;
        pt.b.resize(ct_len);
        u32 pt_len = 0;
        if (!touchseal::core::is_ok(sec::cbc_decrypt(keys.enc, iv, ct, touchseal::core::BufferMut{pt.b.data(), ct_len}, &pt_len)) ||
            pt_len == 0) {
            return decrypt_failed();
        }

        plaintext_out->assign(pt.b.begin(), pt.b.begin() + pt_len);
        return touchseal::core::ok_status();
    }
} // namespace touchseal::seal
