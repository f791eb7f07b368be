#include "touchseal/cli/commands.hpp"

#include <cstring>

namespace touchseal::cli {
    touchseal::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Cli, touchseal::core::StatusCode::Invalid);
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = CliArgs{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Cli, touchseal::core::StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Cli, touchseal::core::StatusCode::Invalid);
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '-') {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Cli, touchseal::core::StatusCode::Invalid);
        }

        for (u32 i = 0; i < spec_count; ++i) {
            if (specs[i].name != nullptr && std::strcmp(specs[i].name, cmd) == 0) {
                out->id = specs[i].id;
                out->args.argv = args.argv + 1;
                out->args.argc = args.argc - 1;
                *consumed = 1;
                return touchseal::core::ok_status();
            }
        }
        return touchseal::core::make_status(touchseal::core::StatusDomain::Cli, touchseal::core::StatusCode::NotFound);
    }

    int exit_code_for(touchseal::core::Status s) noexcept {
        if (touchseal::core::is_ok(s)) {
            return kExitOk;
        }
        if (s.domain == touchseal::core::StatusDomain::Cli && s.code == touchseal::core::StatusCode::Io) {
            return kExitFailure;
        }
        switch (s.domain) {
        case touchseal::core::StatusDomain::Input: return kExitInput;
        case touchseal::core::StatusDomain::Credential: return kExitCredential;
        case touchseal::core::StatusDomain::Oracle: return kExitOracle;
        case touchseal::core::StatusDomain::Crypto: return kExitCrypto;
        case touchseal::core::StatusDomain::Cli: return kExitUsage;
        default: return kExitFailure;
        }
    }
} // namespace touchseal::cli
