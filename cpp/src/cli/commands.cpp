#include "seedvault/cli/commands.hpp"

#include <cstring>
#include <utility>

#include <nlohmann/json.hpp>

#include "seedvault/core/log.hpp"
#include "seedvault/security/client_envelope.hpp"
#include "seedvault/security/credentials.hpp"

namespace seedvault::cli {
    using json = nlohmann::json;

    namespace {
        [[nodiscard]] seedvault::core::Status cli_status(seedvault::core::StatusCode code) noexcept {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Cli, code);
        }
    } // namespace

    seedvault::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_status(seedvault::core::StatusCode::Invalid);
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = CliArgs{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return cli_status(seedvault::core::StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return cli_status(seedvault::core::StatusCode::Invalid);
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '-') {
            return cli_status(seedvault::core::StatusCode::Invalid);
        }

        const CommandSpec* match = nullptr;
        for (u32 i = 0; i < spec_count; ++i) {
            const CommandSpec& s = specs[i];
            if (s.name != nullptr && std::strcmp(s.name, cmd) == 0) {
                match = &s;
                break;
            }
        }
        if (match == nullptr) {
            return cli_status(seedvault::core::StatusCode::NotFound);
        }

        out->id = match->id;
        out->args.argv = args.argv + 1;
        out->args.argc = args.argc - 1;
        *consumed = 1;
        return seedvault::core::ok_status();
    }

    seedvault::core::Status kdf_params_from_options(const ParsedOptions& opts, seedvault::security::KdfParams* out) noexcept {
        if (out == nullptr) {
            return cli_status(seedvault::core::StatusCode::Invalid);
        }
        seedvault::security::KdfParams params = seedvault::security::kClientKdf;
        if (const ParsedOption* it = find_option(opts, OptionId::Iterations); it != nullptr) {
            if (it->value.i64v < static_cast<i64>(seedvault::security::kKdfIterationFloor) || it->value.i64v > 0xffffffffLL) {
                return cli_status(seedvault::core::StatusCode::WeakParameters);
            }
            params.iterations = static_cast<u32>(it->value.i64v);
        }
        *out = params;
        return seedvault::core::ok_status();
    }

    seedvault::core::Status run_seal(std::string_view password,
        std::string_view document,
        const seedvault::security::KdfParams& params,
        std::string* out) noexcept {
        if (out == nullptr) {
            return cli_status(seedvault::core::StatusCode::Invalid);
        }
        if (!json::accept(document.begin(), document.end())) {
            seedvault::core::log_write(seedvault::core::LogLevel::Error, "seal: input is not JSON");
            return cli_status(seedvault::core::StatusCode::Invalid);
        }
        seedvault::core::Status s = seedvault::security::password_policy_check(password, seedvault::security::PasswordKind::Master);
        if (!seedvault::core::is_ok(s)) {
            seedvault::core::log_write(seedvault::core::LogLevel::Error,
                "seal: master password needs 8+ chars with lower, upper, digit and symbol");
            return s;
        }

        seedvault::security::SealedVault sealed;
        s = seedvault::security::seal_vault(password, document, params, &sealed);
        if (!seedvault::core::is_ok(s)) {
            return s;
        }
        *out = json{{"encryptedData", sealed.blob}, {"clientSalt", sealed.salt}}.dump(2);
        return seedvault::core::ok_status();
    }

    seedvault::core::Status run_open(std::string_view password,
        std::string_view sealed_json,
        const seedvault::security::KdfParams& params,
        std::string* out) noexcept {
        if (out == nullptr) {
            return cli_status(seedvault::core::StatusCode::Invalid);
        }
        const json sealed = json::parse(sealed_json.begin(), sealed_json.end(), nullptr, false);
        if (sealed.is_discarded() || !sealed.is_object()) {
            return cli_status(seedvault::core::StatusCode::Invalid);
        }
        const auto blob = sealed.find("encryptedData");
        const auto salt = sealed.find("clientSalt");
        if (blob == sealed.end() || salt == sealed.end() || !blob->is_string() || !salt->is_string()) {
            return cli_status(seedvault::core::StatusCode::Invalid);
        }

        std::optional<std::string> doc = seedvault::security::open_vault(password,
            salt->get_ref<const std::string&>(), blob->get_ref<const std::string&>(), params);
        if (!doc) {
            return cli_status(seedvault::core::StatusCode::Authentication);
        }
        *out = std::move(*doc);
        return seedvault::core::ok_status();
    }

    std::string strength_line(std::string_view password) {
        const seedvault::security::PasswordStrength st = seedvault::security::password_strength(password);
        std::string line = std::to_string(st.score);
        line += "/5 ";
        line += st.label;
        return line;
    }
} // namespace seedvault::cli
