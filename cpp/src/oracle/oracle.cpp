#include "touchseal/oracle/oracle.hpp"

#include "touchseal/security/crypto.hpp"

namespace touchseal::oracle {
    touchseal::core::Status oracle_sign(const SigningOracle& oracle,
        BufferView message,
        const touchseal::credential::Credential& cred,
        std::vector<u8>* signature_out) {
        if (signature_out == nullptr || message.len == 0 || !touchseal::core::buffer_ok(message)) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Oracle, touchseal::core::StatusCode::Invalid);
        }
        touchseal::security::secure_wipe(signature_out->data(), signature_out->size());
        signature_out->clear();
        if (oracle.sign == nullptr) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Oracle, touchseal::core::StatusCode::Unavailable);
        }

        const touchseal::core::Status s = oracle.sign(oracle.ctx, message, cred, signature_out);
        if (!touchseal::core::is_ok(s)) {
            // A partial signature is key material; clear() alone leaves it in the buffer.
            touchseal::security::secure_wipe(signature_out->data(), signature_out->size());
            signature_out->clear();
            if (s.domain != touchseal::core::StatusDomain::Oracle) {
                return touchseal::core::make_status(touchseal::core::StatusDomain::Oracle,
                    touchseal::core::StatusCode::DeviceError,
                    static_cast<touchseal::core::u32>(s.code));
            }
            return s;
        }
        if (signature_out->empty()) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Oracle, touchseal::core::StatusCode::DeviceError);
        }
        return touchseal::core::ok_status();
    }
} // namespace touchseal::oracle
