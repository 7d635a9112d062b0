#include "seedvault/security/kdf.hpp"

#include <climits>
#include <utility>

#include <openssl/evp.h>

namespace seedvault::security {
    namespace {
        [[nodiscard]] const EVP_MD* digest_for(KdfHash h) noexcept {
            switch (h) {
                case KdfHash::Sha256: return EVP_sha256();
                case KdfHash::Sha512: return EVP_sha512();
            }
            return nullptr;
        }
    } // namespace

    seedvault::core::Status derive_key(BufferView password,
        BufferView salt,
        const KdfParams& params,
        DerivedKey* out) noexcept {
        if (out == nullptr) {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Invalid);
        }
        if (password.len == 0 || password.data == nullptr || salt.len == 0 || salt.data == nullptr) {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Invalid);
        }
        if (password.len > static_cast<u32>(INT_MAX) || salt.len > static_cast<u32>(INT_MAX)) {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Invalid);
        }
        if (params.iterations < kKdfIterationFloor || params.iterations > static_cast<u32>(INT_MAX)) {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::WeakParameters);
        }
        const EVP_MD* md = digest_for(params.hash);
        if (md == nullptr) {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Unsupported);
        }

        DerivedKey key;
        const BufferMut dst = key.writable();
        const int ok = PKCS5_PBKDF2_HMAC(reinterpret_cast<const char*>(password.data),
            static_cast<int>(password.len),
            salt.data,
            static_cast<int>(salt.len),
            static_cast<int>(params.iterations),
            md,
            static_cast<int>(dst.len),
            dst.data);
        if (ok != 1) {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Crypto);
        }

        *out = std::move(key);
        return seedvault::core::ok_status();
    }
} // namespace seedvault::security
