#include "seedvault/security/client_envelope.hpp"

#include <array>
#include <utility>
#include <vector>

#include "seedvault/encoding/base64.hpp"
#include "seedvault/security/random.hpp"

namespace seedvault::security {
    seedvault::core::Status seal_vault(std::string_view password,
        std::string_view plaintext_json,
        const KdfParams& params,
        SealedVault* out) noexcept {
        if (out == nullptr || password.empty() || password.size() > seedvault::core::kMaxPayloadBytes) {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Invalid);
        }
        if (plaintext_json.size() > seedvault::core::kMaxPayloadBytes) {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Invalid);
        }

        std::array<u8, kClientSaltLen> salt{};
        seedvault::core::Status s = random_fill(BufferMut{salt.data(), kClientSaltLen});
        if (!seedvault::core::is_ok(s)) {
            return s;
        }

        DerivedKey key;
        s = derive_key(seedvault::core::view_of(password), BufferView{salt.data(), kClientSaltLen}, params, &key);
        if (!seedvault::core::is_ok(s)) {
            return s;
        }

        Envelope env;
        s = envelope_seal(kClientLayout, key, BufferView{salt.data(), kClientSaltLen},
            seedvault::core::view_of(plaintext_json), BufferView{}, &env);
        key.wipe();
        if (!seedvault::core::is_ok(s)) {
            return s;
        }

        SealedVault sealed;
        s = envelope_encode(env, &sealed.blob);
        if (!seedvault::core::is_ok(s)) {
            return s;
        }
        s = seedvault::encoding::base64_encode(BufferView{salt.data(), kClientSaltLen}, &sealed.salt);
        if (!seedvault::core::is_ok(s)) {
            return s;
        }

        *out = std::move(sealed);
        return seedvault::core::ok_status();
    }

    std::optional<std::string> open_vault(std::string_view password,
        std::string_view salt_b64,
        std::string_view blob,
        const KdfParams& params) noexcept {
        if (password.empty() || password.size() > seedvault::core::kMaxPayloadBytes) {
            return std::nullopt;
        }

        std::vector<u8> salt;
        if (!seedvault::core::is_ok(seedvault::encoding::base64_decode(salt_b64, &salt)) || salt.size() != kClientSaltLen) {
            return std::nullopt;
        }

        Envelope env;
        if (!seedvault::core::is_ok(envelope_decode(kClientLayout, blob, &env))) {
            return std::nullopt;
        }
        const BufferView salt_view{salt.data(), kClientSaltLen};
        if (!equal_ct(salt_view, BufferView{env.salt.data(), static_cast<u32>(env.salt.size())})) {
            return std::nullopt;
        }

        DerivedKey key;
        if (!seedvault::core::is_ok(derive_key(seedvault::core::view_of(password), salt_view, params, &key))) {
            return std::nullopt;
        }

        std::vector<u8> pt;
        const seedvault::core::Status s = envelope_open(kClientLayout, key, env, BufferView{}, &pt);
        key.wipe();
        if (!seedvault::core::is_ok(s)) {
            return std::nullopt;
        }

        std::string plaintext(pt.begin(), pt.end());
        wipe_vector(&pt);
        return plaintext;
    }
} // namespace seedvault::security
