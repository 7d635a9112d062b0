#include "seedvault/security/crypto.hpp"

#include <climits>
#include <cstddef>
#include <memory>

#include <openssl/evp.h>

namespace seedvault::security {
    namespace {
        struct CipherCtxDeleter {
            void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
        };
        using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

        [[nodiscard]] seedvault::core::Status sec(seedvault::core::StatusCode code) noexcept {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, code);
        }

        [[nodiscard]] bool fits_int(u32 len) noexcept {
            return len <= static_cast<u32>(INT_MAX);
        }
    } // namespace

    seedvault::core::Status gcm_seal(const DerivedKey& key,
        BufferView nonce,
        BufferView aad,
        BufferView pt,
        BufferMut ct_out,
        Tag16* tag_out) noexcept {
        if (tag_out == nullptr || !key.is_set()) {
            return sec(seedvault::core::StatusCode::Invalid);
        }
        if (!seedvault::core::buffer_ok(aad) || !seedvault::core::buffer_ok(pt) || !seedvault::core::buffer_ok(ct_out)) {
            return sec(seedvault::core::StatusCode::Invalid);
        }
        if (nonce.data == nullptr || !gcm_nonce_len_ok(nonce.len)) {
            return sec(seedvault::core::StatusCode::Invalid);
        }
        if (ct_out.len < pt.len || !fits_int(pt.len) || !fits_int(aad.len)) {
            return sec(seedvault::core::StatusCode::Invalid);
        }

        CipherCtx ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return sec(seedvault::core::StatusCode::Unavailable);
        }

        int ok = 1;
        ok &= EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr);
        ok &= EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.len), nullptr);
        ok &= EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data);

        int out_len = 0;
        if (aad.len > 0) {
            ok &= EVP_EncryptUpdate(ctx.get(), nullptr, &out_len, aad.data, static_cast<int>(aad.len));
        }

        int ct_written = 0;
        if (pt.len > 0) {
            ok &= EVP_EncryptUpdate(ctx.get(), ct_out.data, &out_len, pt.data, static_cast<int>(pt.len));
            ct_written += out_len;
        }

        ok &= EVP_EncryptFinal_ex(ctx.get(), ct_out.data + ct_written, &out_len);
        ct_written += out_len;

        ok &= EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(sizeof(tag_out->b)), tag_out->b);

        if (!ok || static_cast<u32>(ct_written) != pt.len) {
            return sec(seedvault::core::StatusCode::Crypto);
        }
        return seedvault::core::ok_status();
    }

    seedvault::core::Status gcm_open(const DerivedKey& key,
        BufferView nonce,
        BufferView aad,
        BufferView ct,
        const Tag16& tag,
        BufferMut pt_out) noexcept {
        if (!key.is_set()) {
            return sec(seedvault::core::StatusCode::Authentication);
        }
        if (!seedvault::core::buffer_ok(aad) || !seedvault::core::buffer_ok(ct) || !seedvault::core::buffer_ok(pt_out)) {
            return sec(seedvault::core::StatusCode::Authentication);
        }
        if (nonce.data == nullptr || !gcm_nonce_len_ok(nonce.len)) {
            return sec(seedvault::core::StatusCode::Authentication);
        }
        if (pt_out.len < ct.len || !fits_int(ct.len) || !fits_int(aad.len)) {
            return sec(seedvault::core::StatusCode::Authentication);
        }

        CipherCtx ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return sec(seedvault::core::StatusCode::Unavailable);
        }

        int ok = 1;
        ok &= EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr);
        ok &= EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.len), nullptr);
        ok &= EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data);

        int out_len = 0;
        if (aad.len > 0) {
            ok &= EVP_DecryptUpdate(ctx.get(), nullptr, &out_len, aad.data, static_cast<int>(aad.len));
        }

        int pt_written = 0;
        if (ct.len > 0) {
            ok &= EVP_DecryptUpdate(ctx.get(), pt_out.data, &out_len, ct.data, static_cast<int>(ct.len));
            pt_written += out_len;
        }

        // OpenSSL compares the tag in constant time inside DecryptFinal.
        ok &= EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(sizeof(tag.b)), const_cast<u8*>(tag.b));
        const int final_ok = EVP_DecryptFinal_ex(ctx.get(), pt_out.data + pt_written, &out_len);

        if (!ok || final_ok <= 0) {
            wipe_bytes(pt_out.data, pt_out.len);
            return sec(seedvault::core::StatusCode::Authentication);
        }
        pt_written += out_len;
        if (static_cast<u32>(pt_written) != ct.len) {
            wipe_bytes(pt_out.data, pt_out.len);
            return sec(seedvault::core::StatusCode::Authentication);
        }
        return seedvault::core::ok_status();
    }
} // namespace seedvault::security
