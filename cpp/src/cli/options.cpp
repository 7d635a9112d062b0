#include "seedvault/cli/options.hpp"

#include <charconv>
#include <cstring>
#include <system_error>

namespace seedvault::cli {
    namespace {
        [[nodiscard]] seedvault::core::Status cli_invalid() noexcept {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Cli, seedvault::core::StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name, std::size_t name_len) noexcept {
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
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (out == nullptr || s == nullptr) {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] bool store_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            if (spec.type == OptionType::String) {
                opt->value.str = value;
                return true;
            }
            if (spec.type == OptionType::I64) {
                return parse_i64(value, &opt->value.i64v);
            }
            return false;
        }

        [[nodiscard]] seedvault::core::Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->cap == 0 || out->data == nullptr || out->len >= out->cap) {
                return cli_invalid();
            }
            out->data[out->len++] = opt;
            return seedvault::core::ok_status();
        }
    } // namespace

    seedvault::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_invalid();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return cli_invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return cli_invalid();
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
            const char* value = nullptr;
            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const std::size_t name_len = eq != nullptr ? static_cast<std::size_t>(eq - name) : std::strlen(name);
                if (name_len == 0) {
                    return cli_invalid();
                }
                spec = find_long(specs, spec_count, name, name_len);
                if (eq != nullptr) {
                    value = eq + 1;
                }
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (tok[2] != '\0') {
                    value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return cli_invalid();
            }

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;

            if (spec->type == OptionType::Flag) {
                if (value != nullptr) {
                    return cli_invalid();
                }
                opt.value.boolv = 1;
                ++i;
            } else if (value != nullptr) {
                ++i;
            } else {
                if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                    return cli_invalid();
                }
                value = args.argv[i + 1];
                i += 2;
            }

            if (spec->type != OptionType::Flag && !store_value(*spec, value, &opt)) {
                return cli_invalid();
            }
            const seedvault::core::Status s = push_option(out, opt);
            if (!seedvault::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return seedvault::core::ok_status();
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
} // namespace seedvault::cli
