#pragma once

#include <string_view>
#include <vector>

#include "touchseal/core/errors.hpp"
#include "touchseal/core/types.hpp"
#include "touchseal/credential/credential.hpp"
#include "touchseal/oracle/oracle.hpp"

namespace touchseal::oracle {
    using u32 = touchseal::core::u32;

    inline constexpr u32 kDefaultSignTimeoutMs = 60000;
    inline constexpr const char* kDefaultSignNamespace = "touchseal";

    // Drives `<program> -Y sign -f <key> -n <namespace>` with the message on
    // stdin. OpenSSH owns the FIDO2 transport and the touch prompt.
    struct SshSignerConfig {
        const char* program{"ssh-keygen"};
        const char* sign_namespace{kDefaultSignNamespace};
        u32 timeout_ms{kDefaultSignTimeoutMs};
        int prompt_fd{-1}; // child's stderr is copied here as it arrives; -1 discards it
    };

    // SignFn over a `const SshSignerConfig*` context. The child is killed and
    // Oracle/Timeout returned once timeout_ms elapses.
    touchseal::core::Status ssh_keygen_sign(void* ctx,
        BufferView message,
        const touchseal::credential::Credential& cred,
        std::vector<u8>* signature_out);

    [[nodiscard]] inline SigningOracle ssh_keygen_oracle(const SshSignerConfig* cfg) noexcept {
        return SigningOracle{&ssh_keygen_sign, const_cast<SshSignerConfig*>(cfg)};
    }

    // Maps a failed signer run to an Oracle status from its exit code and stderr.
    [[nodiscard]] touchseal::core::Status classify_signer_failure(int exit_code, std::string_view stderr_text) noexcept;

    // Unwraps "-----BEGIN SSH SIGNATURE-----" armor. Checks the SSHSIG magic,
    // version, namespace and that the embedded public key is cred's, then
    // returns the inner signature blob.
    touchseal::core::Status sshsig_parse(std::string_view armored,
        const touchseal::credential::Credential& cred,
        std::string_view expected_namespace,
        std::vector<u8>* signature_out);

} // namespace touchseal::oracle
