#include "seedvault/security/session.hpp"

#include <utility>

#include "seedvault/encoding/base64.hpp"
#include "seedvault/security/client_envelope.hpp"
#include "seedvault/security/codec.hpp"

namespace seedvault::security {
    namespace {
        [[nodiscard]] seedvault::core::Status auth_failed() noexcept {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Authentication);
        }
    } // namespace

    seedvault::core::Status VaultSession::unlock(std::string_view password,
        std::string_view salt_b64,
        std::string_view blob,
        const KdfParams& params,
        std::string* out) {
        if (out == nullptr || password.empty() || password.size() > seedvault::core::kMaxPayloadBytes) {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Invalid);
        }
        lock();

        std::vector<u8> salt;
        if (!seedvault::core::is_ok(seedvault::encoding::base64_decode(salt_b64, &salt)) || salt.size() != kClientSaltLen) {
            return auth_failed();
        }
        Envelope env;
        if (!seedvault::core::is_ok(envelope_decode(kClientLayout, blob, &env))) {
            return auth_failed();
        }
        const BufferView salt_view{salt.data(), kClientSaltLen};
        if (!equal_ct(salt_view, BufferView{env.salt.data(), static_cast<u32>(env.salt.size())})) {
            return auth_failed();
        }

        DerivedKey key;
        const seedvault::core::Status ds = derive_key(seedvault::core::view_of(password), salt_view, params, &key);
        if (!seedvault::core::is_ok(ds)) {
            return ds;
        }

        std::vector<u8> pt;
        if (!seedvault::core::is_ok(envelope_open(kClientLayout, key, env, BufferView{}, &pt))) {
            return auth_failed();
        }

        out->assign(pt.begin(), pt.end());
        wipe_vector(&pt);
        key_ = std::move(key);
        salt_ = std::move(salt);
        return seedvault::core::ok_status();
    }

    std::optional<std::string> VaultSession::open(std::string_view blob) const {
        if (!is_unlocked()) {
            return std::nullopt;
        }
        Envelope env;
        if (!seedvault::core::is_ok(envelope_decode(kClientLayout, blob, &env))) {
            return std::nullopt;
        }
        if (!equal_ct(BufferView{salt_.data(), static_cast<u32>(salt_.size())},
                BufferView{env.salt.data(), static_cast<u32>(env.salt.size())})) {
            return std::nullopt;
        }

        std::vector<u8> pt;
        if (!seedvault::core::is_ok(envelope_open(kClientLayout, key_, env, BufferView{}, &pt))) {
            return std::nullopt;
        }
        std::string plaintext(pt.begin(), pt.end());
        wipe_vector(&pt);
        return plaintext;
    }

    void VaultSession::lock() noexcept {
        key_.wipe();
        salt_.clear();
    }
} // namespace seedvault::security
