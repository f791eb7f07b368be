#pragma once

#include <vector>

#include "touchseal/core/errors.hpp"
#include "touchseal/core/types.hpp"
#include "touchseal/credential/credential.hpp"

namespace touchseal::oracle {
    using u8 = touchseal::core::u8;
    using BufferView = touchseal::core::BufferView;

    // Signs `message` with `cred`. May block on user presence. Failures are
    // Oracle/{UserDeclined, DeviceAbsent, DeviceError, Timeout}.
    using SignFn = touchseal::core::Status (*)(void* ctx,
        BufferView message,
        const touchseal::credential::Credential& cred,
        std::vector<u8>* signature_out);

    struct SigningOracle {
        SignFn sign{nullptr};
        void* ctx{nullptr};
    };

    // Calls the adapter once. A missing adapter is Oracle/Unavailable, an
    // empty signature is Oracle/DeviceError, and a failure reported outside
    // the Oracle domain is rewrapped as Oracle/DeviceError with the original
    // code in aux.
    touchseal::core::Status oracle_sign(const SigningOracle& oracle,
        BufferView message,
        const touchseal::credential::Credential& cred,
        std::vector<u8>* signature_out);

} // namespace touchseal::oracle
