#include "seedvault/vault/export.hpp"

#include <nlohmann/json.hpp>

#include "seedvault/core/clock.hpp"
#include "seedvault/core/log.hpp"
#include "seedvault/security/client_envelope.hpp"

namespace seedvault::vault {
    using json = nlohmann::json;

    namespace {
        [[nodiscard]] const std::string* string_field(const json& j, const char* key) {
            const auto it = j.find(key);
            if (it == j.end() || !it->is_string()) {
                return nullptr;
            }
            return it->get_ptr<const std::string*>();
        }
    } // namespace

    seedvault::core::Status export_vault_file(std::string_view password,
        std::string_view plaintext_json,
        seedvault::core::Timestamp now,
        const seedvault::security::KdfParams& params,
        std::string* out) noexcept {
        if (out == nullptr) {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Vault, seedvault::core::StatusCode::Invalid);
        }

        seedvault::security::SealedVault sealed;
        const seedvault::core::Status s = seedvault::security::seal_vault(password, plaintext_json, params, &sealed);
        if (!seedvault::core::is_ok(s)) {
            return s;
        }

        json file = {
            {"version", std::string(kExportVersion)},
            {"timestamp", seedvault::core::format_iso8601(now)},
            {"salt", sealed.salt},
            {"data", sealed.blob},
        };
        *out = file.dump(2, ' ', false, json::error_handler_t::replace);
        return seedvault::core::ok_status();
    }

    std::optional<std::string> import_vault_file(std::string_view password,
        std::string_view file_json,
        const seedvault::security::KdfParams& params) noexcept {
        const json file = json::parse(file_json.begin(), file_json.end(), nullptr, false);
        if (file.is_discarded() || !file.is_object()) {
            seedvault::core::log_write(seedvault::core::LogLevel::Debug, "import: not a JSON object");
            return std::nullopt;
        }

        const std::string* version = string_field(file, "version");
        const std::string* salt = string_field(file, "salt");
        const std::string* data = string_field(file, "data");
        if (version == nullptr || salt == nullptr || data == nullptr) {
            seedvault::core::log_write(seedvault::core::LogLevel::Debug, "import: missing version, salt or data");
            return std::nullopt;
        }
        if (*version != kExportVersion) {
            seedvault::core::log_write(seedvault::core::LogLevel::Warn, "import: unsupported export version");
            return std::nullopt;
        }

        return seedvault::security::open_vault(password, *salt, *data, params);
    }
} // namespace seedvault::vault
