#pragma once

#include <type_traits>

#include "touchseal/cli/options.hpp"
#include "touchseal/core/errors.hpp"

namespace touchseal::cli {
    using u32 = touchseal::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Encrypt = 2,
        Decrypt = 3,
        Fingerprint = 4,
    };

    enum ExitCode : int {
        kExitOk = 0,
        kExitFailure = 1,
        kExitUsage = 2,
        kExitInput = 3,
        kExitCredential = 4,
        kExitOracle = 5,
        kExitCrypto = 6,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    touchseal::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    // Process exit code for a failed command. I/O failures are not usage
    // errors even when raised by the CLI layer.
    [[nodiscard]] int exit_code_for(touchseal::core::Status s) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace touchseal::cli
