#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "seedvault/core/errors.hpp"
#include "seedvault/core/types.hpp"
#include "seedvault/security/crypto.hpp"
#include "seedvault/security/secure_key.hpp"

namespace seedvault::security {

    // Field sizes of one envelope flavour. The wire form is always
    //   base64(salt || nonce || tag || ciphertext)
    // and must stay bit-exact across implementations.
    struct EnvelopeLayout {
        u32 salt_len{16};
        u32 nonce_len{12};
        bool bind_salt{false}; // salt is prepended to the AAD
    };

    inline constexpr u32 kTagLen = 16;

    inline constexpr EnvelopeLayout kClientLayout{16, 12, false};
    inline constexpr EnvelopeLayout kServerLayout{32, 16, true};

    struct Envelope {
        std::vector<u8> salt;
        std::vector<u8> nonce;
        Tag16 tag{};
        std::vector<u8> ciphertext;
    };

    // Draws a fresh nonce, encrypts pt under key. salt is the KDF salt that
    // produced key; it is carried in the envelope and, for layouts with
    // bind_salt, authenticated.
    seedvault::core::Status envelope_seal(const EnvelopeLayout& layout,
        const DerivedKey& key,
        BufferView salt,
        BufferView pt,
        BufferView aad,
        Envelope* out) noexcept;

    // Tag mismatch and malformed envelopes are both Authentication; callers
    // get no way to tell them apart.
    seedvault::core::Status envelope_open(const EnvelopeLayout& layout,
        const DerivedKey& key,
        const Envelope& env,
        BufferView aad,
        std::vector<u8>* pt_out) noexcept;

    seedvault::core::Status envelope_encode(const Envelope& env, std::string* out) noexcept;

    // Splits a wire blob according to layout. Bad base64 or a blob shorter
    // than salt + nonce + tag is Authentication.
    seedvault::core::Status envelope_decode(const EnvelopeLayout& layout,
        std::string_view blob,
        Envelope* out) noexcept;

} // namespace seedvault::security
