#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>
#include <unistd.h>

#include "touchseal/cli/commands.hpp"
#include "touchseal/cli/options.hpp"
#include "touchseal/core/errors.hpp"
#include "touchseal/credential/credential.hpp"
#include "touchseal/oracle/ssh_signer.hpp"
#include "touchseal/seal/seal.hpp"

using touchseal::core::Status;
using touchseal::core::StatusCode;
using touchseal::core::StatusDomain;

// ========================================================================
// Configuration
// ========================================================================

struct CliConfig {
    std::string key_path;
    std::string sign_namespace{touchseal::oracle::kDefaultSignNamespace};
    touchseal::core::u32 timeout_ms{touchseal::oracle::kDefaultSignTimeoutMs};
    touchseal::security::HashId kdf_hash{touchseal::security::HashId::Sha256};
    bool allow_ecdsa{false};
    std::string output_path;
    bool verbose{false};
};

constexpr size_t kMaxInputBytes = 1u << 20;

using touchseal::cli::exit_code_for;
using touchseal::cli::kExitOk;
using touchseal::cli::kExitUsage;

// ========================================================================
// Reporting
// ========================================================================

void print_usage(FILE* out) {
    fprintf(out,
        "usage: touchseal [options] <command> [args]\n"
        "\n"
        "commands:\n"
        "  encrypt [text|-]      seal text (stdin when omitted) into an envelope\n"
        "  decrypt [envelope|-]  open an envelope (stdin when omitted)\n"
        "  fingerprint           print the credential fingerprint\n"
        "  help                  show this message\n"
        "\n"
        "options:\n"
        "  -k, --key PATH        FIDO2-backed SSH key (default $TOUCHSEAL_KEY, then ~/.ssh/id_ed25519_sk)\n"
        "  -n, --namespace NS    signature namespace (default \"%s\")\n"
        "  -t, --timeout SEC     wait at most SEC seconds for the security key (default %u)\n"
        "      --hash NAME       key derivation hash: sha256 (default) or blake3\n"
        "      --allow-ecdsa     accept ECDSA keys, whose signatures are not reproducible\n"
        "  -o, --output PATH     write the result to PATH instead of stdout\n"
        "  -v, --verbose         print progress to stderr\n",
        touchseal::oracle::kDefaultSignNamespace,
        touchseal::oracle::kDefaultSignTimeoutMs / 1000);
}

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

const char* describe_status(Status s) {
    switch (s.code) {
    case StatusCode::Empty: return "input is empty";
    case StatusCode::Format: return "malformed envelope";
    case StatusCode::NotFound: return s.domain == StatusDomain::Credential ? "key not found" : "not found";
    case StatusCode::Unreadable: return "key is not readable";
    case StatusCode::InvalidFormat: return "unrecognized public key";
    case StatusCode::NotHardwareBacked: return "key is not backed by a security key";
    case StatusCode::Unsupported: return "key type does not sign deterministically (see --allow-ecdsa)";
    case StatusCode::UserDeclined: return "signing was declined";
    case StatusCode::DeviceAbsent: return "security key not present";
    case StatusCode::DeviceError: return "security key or signer failed";
    case StatusCode::Timeout: return "timed out waiting for the security key";
    case StatusCode::Unavailable: return "signer is unavailable";
    case StatusCode::Io: return "i/o error";
    default: return touchseal::core::status_code_name(s.code);
    }
}

void print_status_error(const char* context, Status s) {
    fprintf(stderr, "error: %s: %s [%s/%s]\n",
        context,
        describe_status(s),
        touchseal::core::status_domain_name(s.domain),
        touchseal::core::status_code_name(s.code));
    if (s.domain == StatusDomain::Credential && s.aux != 0) {
        fprintf(stderr, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
    }
}

// ========================================================================
// I/O Utilities
// ========================================================================

Status read_stream(FILE* f, std::string* out) {
    out->clear();
    char chunk[4096];
    for (;;) {
        const size_t n = fread(chunk, 1, sizeof(chunk), f);
        out->append(chunk, n);
        if (out->size() > kMaxInputBytes) {
            return touchseal::core::make_status(StatusDomain::Input, StatusCode::Invalid);
        }
        if (n < sizeof(chunk)) {
            break;
        }
    }
    if (ferror(f)) {
        return touchseal::core::make_status(StatusDomain::Cli, StatusCode::Io, static_cast<touchseal::core::u32>(errno));
    }
    return touchseal::core::ok_status();
}

// Positional text wins; "-" or nothing reads stdin.
Status read_input(const touchseal::cli::CliArgs& args, std::string* out) {
    if (args.argc > 1) {
        return touchseal::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    if (args.argc == 1 && std::strcmp(args.argv[0], "-") != 0) {
        out->assign(args.argv[0]);
        return touchseal::core::ok_status();
    }
    return read_stream(stdin, out);
}

Status write_output(const CliConfig& cfg, const void* data, size_t size) {
    FILE* f = stdout;
    if (!cfg.output_path.empty()) {
        f = fopen(cfg.output_path.c_str(), "wb");
        if (!f) {
            return touchseal::core::make_status(StatusDomain::Cli, StatusCode::Io, static_cast<touchseal::core::u32>(errno));
        }
    }

    const size_t written = fwrite(data, 1, size, f);
    const bool flushed = fflush(f) == 0;
    if (f != stdout) {
        fclose(f);
    }

    if (written != size || !flushed) {
        return touchseal::core::make_status(StatusDomain::Cli, StatusCode::Io);
    }
    return touchseal::core::ok_status();
}

std::string_view trim_trailing_space(std::string_view s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

std::string default_key_path() {
    const char* env = std::getenv("TOUCHSEAL_KEY");
    if (env != nullptr && env[0] != '\0') {
        return env;
    }
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return std::string(home) + "/.ssh/id_ed25519_sk";
    }
    return std::string();
}

// ========================================================================
// Option Handling
// ========================================================================

const touchseal::cli::OptionSpec kOptionSpecs[] = {
    {touchseal::cli::OptionId::Key, touchseal::cli::OptionType::String, "key", 'k'},
    {touchseal::cli::OptionId::Namespace, touchseal::cli::OptionType::String, "namespace", 'n'},
    {touchseal::cli::OptionId::Timeout, touchseal::cli::OptionType::I64, "timeout", 't'},
    {touchseal::cli::OptionId::Hash, touchseal::cli::OptionType::String, "hash", '\0'},
    {touchseal::cli::OptionId::AllowEcdsa, touchseal::cli::OptionType::Flag, "allow-ecdsa", '\0'},
    {touchseal::cli::OptionId::Output, touchseal::cli::OptionType::String, "output", 'o'},
    {touchseal::cli::OptionId::Verbose, touchseal::cli::OptionType::Flag, "verbose", 'v'},
    {touchseal::cli::OptionId::Help, touchseal::cli::OptionType::Flag, "help", 'h'},
};

const touchseal::cli::CommandSpec kCommandSpecs[] = {
    {touchseal::cli::CommandId::Help, "help"},
    {touchseal::cli::CommandId::Encrypt, "encrypt"},
    {touchseal::cli::CommandId::Decrypt, "decrypt"},
    {touchseal::cli::CommandId::Fingerprint, "fingerprint"},
};

constexpr touchseal::core::u32 kMaxParsedOptions = 32;

bool apply_options(const touchseal::cli::ParsedOptions& opts, CliConfig* cfg, bool* want_help) {
    using touchseal::cli::OptionId;

    cfg->key_path = default_key_path();
    for (touchseal::core::u32 i = 0; i < opts.len; ++i) {
        const touchseal::cli::ParsedOption& o = opts.data[i];
        switch (o.id) {
        case OptionId::Key:
            cfg->key_path = o.value.str;
            break;
        case OptionId::Namespace:
            if (o.value.str[0] == '\0') {
                print_error("--namespace must not be empty");
                return false;
            }
            cfg->sign_namespace = o.value.str;
            break;
        case OptionId::Timeout:
            if (o.value.i64v <= 0 || o.value.i64v > 3600) {
                print_error("--timeout must be between 1 and 3600 seconds");
                return false;
            }
            cfg->timeout_ms = static_cast<touchseal::core::u32>(o.value.i64v * 1000);
            break;
        case OptionId::Hash:
            if (std::strcmp(o.value.str, "sha256") == 0) {
                cfg->kdf_hash = touchseal::security::HashId::Sha256;
            } else if (std::strcmp(o.value.str, "blake3") == 0) {
                cfg->kdf_hash = touchseal::security::HashId::Blake3;
            } else {
                fprintf(stderr, "error: --hash: unknown hash %s\n", o.value.str);
                return false;
            }
            break;
        case OptionId::AllowEcdsa:
            cfg->allow_ecdsa = true;
            break;
        case OptionId::Output:
            cfg->output_path = o.value.str;
            break;
        case OptionId::Verbose:
            cfg->verbose = true;
            break;
        case OptionId::Help:
            *want_help = true;
            break;
        default:
            break;
        }
    }
    return true;
}

// ========================================================================
// Commands
// ========================================================================

Status load_credential(const CliConfig& cfg, touchseal::credential::Credential* cred) {
    if (cfg.key_path.empty()) {
        return touchseal::core::make_status(StatusDomain::Credential, StatusCode::NotFound);
    }
    const Status s = touchseal::credential::credential_load(cfg.key_path.c_str(), cred);
    if (touchseal::core::is_ok(s) && cfg.verbose) {
        fprintf(stderr, "info: key %s (%s %s)\n", cred->key_path.c_str(), cred->key_type.c_str(), cred->fingerprint.c_str());
    }
    return s;
}

touchseal::oracle::SshSignerConfig signer_config(const CliConfig& cfg) {
    touchseal::oracle::SshSignerConfig signer{};
    signer.sign_namespace = cfg.sign_namespace.c_str();
    signer.timeout_ms = cfg.timeout_ms;
    signer.prompt_fd = STDERR_FILENO;
    return signer;
}

touchseal::seal::SealConfig seal_config(const CliConfig& cfg) {
    touchseal::seal::SealConfig sc{};
    sc.kdf_hash = cfg.kdf_hash;
    sc.allow_nondeterministic = cfg.allow_ecdsa;
    return sc;
}

int cmd_encrypt(const CliConfig& cfg, const touchseal::cli::CliArgs& args) {
    std::string plaintext;
    Status s = read_input(args, &plaintext);
    if (!touchseal::core::is_ok(s)) {
        print_status_error("encrypt", s);
        return exit_code_for(s);
    }

    touchseal::credential::Credential cred;
    s = load_credential(cfg, &cred);
    if (!touchseal::core::is_ok(s)) {
        print_status_error("encrypt", s);
        return exit_code_for(s);
    }

    const touchseal::oracle::SshSignerConfig signer = signer_config(cfg);
    if (cfg.verbose) {
        fprintf(stderr, "info: signing challenge (namespace %s, %s kdf, timeout %us)\n",
            signer.sign_namespace,
            touchseal::security::hash_name(cfg.kdf_hash),
            cfg.timeout_ms / 1000);
    }

    std::string envelope;
    s = touchseal::seal::seal_encrypt(touchseal::core::view_of(plaintext),
        cred,
        touchseal::oracle::ssh_keygen_oracle(&signer),
        seal_config(cfg),
        &envelope);
    if (!touchseal::core::is_ok(s)) {
        print_status_error("encrypt", s);
        return exit_code_for(s);
    }

    envelope.push_back('\n');
    s = write_output(cfg, envelope.data(), envelope.size());
    if (!touchseal::core::is_ok(s)) {
        print_status_error("encrypt", s);
        return exit_code_for(s);
    }
    return kExitOk;
}

int cmd_decrypt(const CliConfig& cfg, const touchseal::cli::CliArgs& args) {
    std::string text;
    Status s = read_input(args, &text);
    if (!touchseal::core::is_ok(s)) {
        print_status_error("decrypt", s);
        return exit_code_for(s);
    }

    touchseal::credential::Credential cred;
    s = load_credential(cfg, &cred);
    if (!touchseal::core::is_ok(s)) {
        print_status_error("decrypt", s);
        return exit_code_for(s);
    }

    const touchseal::oracle::SshSignerConfig signer = signer_config(cfg);
    std::vector<touchseal::core::u8> plaintext;
    s = touchseal::seal::seal_decrypt(trim_trailing_space(text),
        cred,
        touchseal::oracle::ssh_keygen_oracle(&signer),
        seal_config(cfg),
        &plaintext);
    if (!touchseal::core::is_ok(s)) {
        if (s.domain == StatusDomain::Crypto) {
            print_error("decrypt: wrong key or corrupted data");
        } else {
            print_status_error("decrypt", s);
        }
        return exit_code_for(s);
    }

    s = write_output(cfg, plaintext.data(), plaintext.size());
    if (!touchseal::core::is_ok(s)) {
        print_status_error("decrypt", s);
        return exit_code_for(s);
    }
    return kExitOk;
}

int cmd_fingerprint(const CliConfig& cfg, const touchseal::cli::CliArgs& args) {
    if (args.argc != 0) {
        print_error("fingerprint takes no arguments");
        return kExitUsage;
    }

    touchseal::credential::Credential cred;
    const Status s = load_credential(cfg, &cred);
    if (!touchseal::core::is_ok(s)) {
        print_status_error("fingerprint", s);
        return exit_code_for(s);
    }

    fprintf(stdout, "%s %s%s%s\n",
        cred.fingerprint.c_str(),
        cred.key_type.c_str(),
        cred.comment.empty() ? "" : " ",
        cred.comment.c_str());
    return kExitOk;
}

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    // Broken stdout pipes become write errors instead of killing the process.
    std::signal(SIGPIPE, SIG_IGN);

    const touchseal::cli::CliArgs all{argv + 1, static_cast<touchseal::core::u32>(argc > 0 ? argc - 1 : 0)};

    touchseal::cli::ParsedOption opt_buf[kMaxParsedOptions]{};
    touchseal::cli::ParsedOptions opts{opt_buf, 0, kMaxParsedOptions};
    touchseal::core::u32 consumed = 0;
    Status s = touchseal::cli::parse_options(all, kOptionSpecs,
        static_cast<touchseal::core::u32>(sizeof(kOptionSpecs) / sizeof(kOptionSpecs[0])),
        &opts, &consumed);
    if (!touchseal::core::is_ok(s)) {
        print_error("invalid option");
        print_usage(stderr);
        return kExitUsage;
    }

    CliConfig cfg;
    bool want_help = false;
    if (!apply_options(opts, &cfg, &want_help)) {
        return kExitUsage;
    }

    const touchseal::cli::CliArgs rest{all.argv + consumed, all.argc - consumed};
    if (want_help) {
        print_usage(stdout);
        return kExitOk;
    }
    if (rest.argc == 0) {
        print_usage(stderr);
        return kExitUsage;
    }

    touchseal::cli::CommandInvocation inv{};
    touchseal::core::u32 cmd_consumed = 0;
    s = touchseal::cli::parse_command(rest, kCommandSpecs,
        static_cast<touchseal::core::u32>(sizeof(kCommandSpecs) / sizeof(kCommandSpecs[0])),
        &inv, &cmd_consumed);
    if (!touchseal::core::is_ok(s)) {
        fprintf(stderr, "error: unknown command %s\n", rest.argv[0]);
        print_usage(stderr);
        return kExitUsage;
    }

    switch (inv.id) {
    case touchseal::cli::CommandId::Help:
        print_usage(stdout);
        return kExitOk;
    case touchseal::cli::CommandId::Encrypt:
        return cmd_encrypt(cfg, inv.args);
    case touchseal::cli::CommandId::Decrypt:
        return cmd_decrypt(cfg, inv.args);
    case touchseal::cli::CommandId::Fingerprint:
        return cmd_fingerprint(cfg, inv.args);
    default:
        print_usage(stderr);
        return kExitUsage;
    }
}
