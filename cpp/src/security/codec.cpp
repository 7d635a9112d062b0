#include "seedvault/security/codec.hpp"

#include <cstring>
#include <utility>

#include "seedvault/encoding/base64.hpp"
#include "seedvault/security/random.hpp"

namespace seedvault::security {
    namespace {
        [[nodiscard]] seedvault::core::Status sec(seedvault::core::StatusCode code) noexcept {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, code);
        }

        [[nodiscard]] bool layout_ok(const EnvelopeLayout& layout) noexcept {
            return layout.salt_len > 0 && gcm_nonce_len_ok(layout.nonce_len);
        }

        [[nodiscard]] BufferView view(const std::vector<u8>& v) noexcept {
            return BufferView{v.data(), static_cast<u32>(v.size())};
        }

        // AAD = salt || aad when the layout binds the salt.
        void build_aad(const EnvelopeLayout& layout, BufferView salt, BufferView aad, std::vector<u8>* out) {
            out->clear();
            if (layout.bind_salt) {
                out->insert(out->end(), salt.data, salt.data + salt.len);
            }
            if (aad.len > 0) {
                out->insert(out->end(), aad.data, aad.data + aad.len);
            }
        }
    } // namespace

    seedvault::core::Status envelope_seal(const EnvelopeLayout& layout,
        const DerivedKey& key,
        BufferView salt,
        BufferView pt,
        BufferView aad,
        Envelope* out) noexcept {
        if (out == nullptr || !layout_ok(layout) || !key.is_set()) {
            return sec(seedvault::core::StatusCode::Invalid);
        }
        if (salt.data == nullptr || salt.len != layout.salt_len) {
            return sec(seedvault::core::StatusCode::Invalid);
        }
        if (!seedvault::core::buffer_ok(pt) || !seedvault::core::buffer_ok(aad)) {
            return sec(seedvault::core::StatusCode::Invalid);
        }
        if (pt.len > seedvault::core::kMaxPayloadBytes) {
            return sec(seedvault::core::StatusCode::Invalid);
        }

        Envelope env;
        env.salt.assign(salt.data, salt.data + salt.len);
        env.nonce.resize(layout.nonce_len);
        const seedvault::core::Status rs = random_fill(BufferMut{env.nonce.data(), layout.nonce_len});
        if (!seedvault::core::is_ok(rs)) {
            return rs;
        }

        std::vector<u8> full_aad;
        build_aad(layout, salt, aad, &full_aad);

        env.ciphertext.resize(pt.len);
        const seedvault::core::Status s = gcm_seal(key,
            view(env.nonce),
            view(full_aad),
            pt,
            BufferMut{env.ciphertext.data(), pt.len},
            &env.tag);
        if (!seedvault::core::is_ok(s)) {
            return s;
        }

        *out = std::move(env);
        return seedvault::core::ok_status();
    }

    seedvault::core::Status envelope_open(const EnvelopeLayout& layout,
        const DerivedKey& key,
        const Envelope& env,
        BufferView aad,
        std::vector<u8>* pt_out) noexcept {
        if (pt_out == nullptr) {
            return sec(seedvault::core::StatusCode::Invalid);
        }
        pt_out->clear();
        if (!layout_ok(layout) || env.salt.size() != layout.salt_len || env.nonce.size() != layout.nonce_len) {
            return sec(seedvault::core::StatusCode::Authentication);
        }
        if (!seedvault::core::buffer_ok(aad) || env.ciphertext.size() > seedvault::core::kMaxPayloadBytes) {
            return sec(seedvault::core::StatusCode::Authentication);
        }

        std::vector<u8> full_aad;
        build_aad(layout, view(env.salt), aad, &full_aad);

        std::vector<u8> pt(env.ciphertext.size());
        const seedvault::core::Status s = gcm_open(key,
            view(env.nonce),
            view(full_aad),
            view(env.ciphertext),
            env.tag,
            BufferMut{pt.data(), static_cast<u32>(pt.size())});
        if (!seedvault::core::is_ok(s)) {
            wipe_vector(&pt);
            return sec(seedvault::core::StatusCode::Authentication);
        }

        *pt_out = std::move(pt);
        return seedvault::core::ok_status();
    }

    seedvault::core::Status envelope_encode(const Envelope& env, std::string* out) noexcept {
        if (out == nullptr) {
            return sec(seedvault::core::StatusCode::Invalid);
        }
        const size_t total = env.salt.size() + env.nonce.size() + kTagLen + env.ciphertext.size();
        if (env.ciphertext.size() > seedvault::core::kMaxPayloadBytes) {
            return sec(seedvault::core::StatusCode::Invalid);
        }

        std::vector<u8> raw;
        raw.reserve(total);
        raw.insert(raw.end(), env.salt.begin(), env.salt.end());
        raw.insert(raw.end(), env.nonce.begin(), env.nonce.end());
        raw.insert(raw.end(), env.tag.b, env.tag.b + kTagLen);
        raw.insert(raw.end(), env.ciphertext.begin(), env.ciphertext.end());

        return seedvault::encoding::base64_encode(view(raw), out);
    }

    seedvault::core::Status envelope_decode(const EnvelopeLayout& layout,
        std::string_view blob,
        Envelope* out) noexcept {
        if (out == nullptr) {
            return sec(seedvault::core::StatusCode::Invalid);
        }
        if (!layout_ok(layout) || blob.size() > (seedvault::core::kMaxPayloadBytes / 3 + 1) * 4 + 128) {
            return sec(seedvault::core::StatusCode::Authentication);
        }

        std::vector<u8> raw;
        if (!seedvault::core::is_ok(seedvault::encoding::base64_decode(blob, &raw))) {
            return sec(seedvault::core::StatusCode::Authentication);
        }
        const size_t header = static_cast<size_t>(layout.salt_len) + layout.nonce_len + kTagLen;
        if (raw.size() < header) {
            return sec(seedvault::core::StatusCode::Authentication);
        }

        Envelope env;
        auto it = raw.begin();
        env.salt.assign(it, it + layout.salt_len);
        it += layout.salt_len;
        env.nonce.assign(it, it + layout.nonce_len);
        it += layout.nonce_len;
        std::memcpy(env.tag.b, &*it, kTagLen);
        it += kTagLen;
        env.ciphertext.assign(it, raw.end());

        *out = std::move(env);
        return seedvault::core::ok_status();
    }
} // namespace seedvault::security
