#include "seedvault/security/server_envelope.hpp"

#include <array>
#include <utility>
#include <vector>

#include "seedvault/encoding/base64.hpp"
#include "seedvault/security/random.hpp"

namespace seedvault::security {
    namespace {
        [[nodiscard]] seedvault::core::Status sec(seedvault::core::StatusCode code) noexcept {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, code);
        }

        // Caller wipes the result.
        [[nodiscard]] std::string account_password(seedvault::core::AccountId account, std::string_view server_secret) {
            std::string pw = std::to_string(account.v);
            pw.append(server_secret.data(), server_secret.size());
            return pw;
        }

        seedvault::core::Status derive_account_key(std::string_view server_secret,
            seedvault::core::AccountId account,
            BufferView salt,
            const KdfParams& params,
            DerivedKey* out) noexcept {
            std::string pw = account_password(account, server_secret);
            const seedvault::core::Status s = derive_key(seedvault::core::view_of(pw), salt, params, out);
            wipe_string(&pw);
            return s;
        }
    } // namespace

    seedvault::core::Status wrap_vault(std::string_view server_secret,
        seedvault::core::AccountId account,
        std::string_view inner_blob,
        const KdfParams& params,
        WrappedVault* out) noexcept {
        if (out == nullptr || server_secret.empty() || inner_blob.empty() || !account.is_valid()) {
            return sec(seedvault::core::StatusCode::Invalid);
        }
        if (inner_blob.size() > seedvault::core::kMaxPayloadBytes || server_secret.size() > 4096) {
            return sec(seedvault::core::StatusCode::Invalid);
        }

        std::array<u8, kServerSaltLen> salt{};
        seedvault::core::Status s = random_fill(BufferMut{salt.data(), kServerSaltLen});
        if (!seedvault::core::is_ok(s)) {
            return s;
        }
        const BufferView salt_view{salt.data(), kServerSaltLen};

        DerivedKey key;
        s = derive_account_key(server_secret, account, salt_view, params, &key);
        if (!seedvault::core::is_ok(s)) {
            return s;
        }

        Envelope env;
        s = envelope_seal(kServerLayout, key, salt_view, seedvault::core::view_of(inner_blob), BufferView{}, &env);
        key.wipe();
        if (!seedvault::core::is_ok(s)) {
            return s;
        }

        WrappedVault wrapped;
        s = envelope_encode(env, &wrapped.blob);
        if (!seedvault::core::is_ok(s)) {
            return s;
        }
        s = seedvault::encoding::base64_encode(salt_view, &wrapped.salt);
        if (!seedvault::core::is_ok(s)) {
            return s;
        }

        *out = std::move(wrapped);
        return seedvault::core::ok_status();
    }

    seedvault::core::Status unwrap_vault(std::string_view server_secret,
        seedvault::core::AccountId account,
        std::string_view outer_salt_b64,
        std::string_view outer_blob,
        const KdfParams& params,
        std::string* inner_out) noexcept {
        if (inner_out == nullptr || server_secret.empty() || !account.is_valid()) {
            return sec(seedvault::core::StatusCode::Invalid);
        }
        if (server_secret.size() > 4096) {
            return sec(seedvault::core::StatusCode::Invalid);
        }
        inner_out->clear();

        std::vector<u8> salt;
        if (!seedvault::core::is_ok(seedvault::encoding::base64_decode(outer_salt_b64, &salt)) || salt.size() != kServerSaltLen) {
            return sec(seedvault::core::StatusCode::Authentication);
        }

        Envelope env;
        seedvault::core::Status s = envelope_decode(kServerLayout, outer_blob, &env);
        if (!seedvault::core::is_ok(s)) {
            return sec(seedvault::core::StatusCode::Authentication);
        }
        const BufferView salt_view{salt.data(), kServerSaltLen};
        if (!equal_ct(salt_view, BufferView{env.salt.data(), static_cast<u32>(env.salt.size())})) {
            return sec(seedvault::core::StatusCode::Authentication);
        }

        DerivedKey key;
        s = derive_account_key(server_secret, account, salt_view, params, &key);
        if (!seedvault::core::is_ok(s)) {
            return s;
        }

        std::vector<u8> inner;
        s = envelope_open(kServerLayout, key, env, BufferView{}, &inner);
        key.wipe();
        if (!seedvault::core::is_ok(s)) {
            return sec(seedvault::core::StatusCode::Authentication);
        }

        inner_out->assign(inner.begin(), inner.end());
        return seedvault::core::ok_status();
    }
} // namespace seedvault::security
