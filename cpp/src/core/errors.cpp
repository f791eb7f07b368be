#include "touchseal/core/errors.hpp"

namespace touchseal::core {
    const char* status_code_name(StatusCode c) noexcept {
        switch (c) {
        case StatusCode::Ok: return "Ok";
        case StatusCode::Unknown: return "Unknown";
        case StatusCode::Invalid: return "Invalid";
        case StatusCode::Empty: return "Empty";
        case StatusCode::Format: return "Format";
        case StatusCode::NotFound: return "NotFound";
        case StatusCode::Unreadable: return "Unreadable";
        case StatusCode::InvalidFormat: return "InvalidFormat";
        case StatusCode::NotHardwareBacked: return "NotHardwareBacked";
        case StatusCode::Unsupported: return "Unsupported";
        case StatusCode::UserDeclined: return "UserDeclined";
        case StatusCode::DeviceAbsent: return "DeviceAbsent";
        case StatusCode::DeviceError: return "DeviceError";
        case StatusCode::Timeout: return "Timeout";
        case StatusCode::Io: return "Io";
        case StatusCode::Crypto: return "Crypto";
        case StatusCode::Unavailable: return "Unavailable";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain d) noexcept {
        switch (d) {
        case StatusDomain::Core: return "Core";
        case StatusDomain::Input: return "InputError";
        case StatusDomain::Credential: return "CredentialError";
        case StatusDomain::Oracle: return "OracleError";
        case StatusDomain::Crypto: return "CryptoError";
        case StatusDomain::Cli: return "Cli";
        case StatusDomain::External: return "External";
        }
        return "Unknown";
    }
} // namespace touchseal::core
