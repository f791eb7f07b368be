#include "touchseal/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace touchseal::cli {
    namespace {
        [[nodiscard]] touchseal::core::Status invalid() noexcept {
            return touchseal::core::make_status(touchseal::core::StatusDomain::Cli, touchseal::core::StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name, size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strlen(s.long_name) == name_len &&
                    std::strncmp(s.long_name, name, name_len) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name != '\0' && specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            const char* end = s + std::strlen(s);
            i64 v{};
            const auto r = std::from_chars(s, end, v, 10);
            if (s == end || r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        // Converts `value` to the option type and appends the result.
        [[nodiscard]] touchseal::core::Status push_option(ParsedOptions* out, const OptionSpec& spec, const char* value) noexcept {
            if (out->data == nullptr || out->len >= out->cap) {
                return invalid();
            }

            ParsedOption opt{};
            opt.id = spec.id;
            opt.type = spec.type;
            switch (spec.type) {
            case OptionType::Flag:
                opt.value.boolv = 1;
                break;
            case OptionType::String:
                opt.value.str = value;
                break;
            case OptionType::I64:
                if (!parse_i64(value, &opt.value.i64v)) {
                    return invalid();
                }
                break;
            default:
                return invalid();
            }

            out->data[out->len++] = opt;
            return touchseal::core::ok_status();
        }
    } // namespace

    touchseal::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return invalid();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* inline_value = nullptr;

            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const size_t name_len = (eq != nullptr) ? static_cast<size_t>(eq - name) : std::strlen(name);
                if (name_len == 0) {
                    return invalid();
                }
                spec = find_long(specs, spec_count, name, name_len);
                if (eq != nullptr) {
                    inline_value = eq + 1;
                }
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (tok[2] != '\0') {
                    inline_value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return invalid();
            }

            if (spec->type == OptionType::Flag) {
                if (inline_value != nullptr) {
                    return invalid();
                }
                const touchseal::core::Status s = push_option(out, *spec, nullptr);
                if (!touchseal::core::is_ok(s)) {
                    return s;
                }
                ++i;
                continue;
            }

            const char* value = inline_value;
            if (value == nullptr) {
                if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                    return invalid();
                }
                value = args.argv[i + 1];
                i += 2;
            } else {
                ++i;
            }

            const touchseal::core::Status s = push_option(out, *spec, value);
            if (!touchseal::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return touchseal::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }
} // namespace touchseal::cli
