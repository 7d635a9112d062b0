#include "seedvault/security/fingerprint.hpp"

#include <cstddef>

#include <blake3.h>

namespace seedvault::security {
    namespace {
        constexpr std::size_t kFingerprintBytes = 16;

        void put_u32_be(seedvault::core::u8 out[4], seedvault::core::u32 v) noexcept {
            out[0] = static_cast<seedvault::core::u8>((v >> 24) & 0xffu);
            out[1] = static_cast<seedvault::core::u8>((v >> 16) & 0xffu);
            out[2] = static_cast<seedvault::core::u8>((v >> 8) & 0xffu);
            out[3] = static_cast<seedvault::core::u8>((v >> 0) & 0xffu);
        }

        void update_field(blake3_hasher* h, std::string_view field) noexcept {
            seedvault::core::u8 len[4];
            put_u32_be(len, static_cast<seedvault::core::u32>(field.size()));
            blake3_hasher_update(h, len, sizeof(len));
            if (!field.empty()) {
                blake3_hasher_update(h, field.data(), field.size());
            }
        }

        [[nodiscard]] bool is_space(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\r' || c == '\n';
        }

        [[nodiscard]] bool is_addr_char(char c) noexcept {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || c == '.' || c == ':';
        }
    } // namespace

    std::string normalize_client_address(std::string_view remote_addr) {
        while (!remote_addr.empty() && is_space(remote_addr.front())) {
            remote_addr.remove_prefix(1);
        }
        while (!remote_addr.empty() && is_space(remote_addr.back())) {
            remote_addr.remove_suffix(1);
        }
        if (remote_addr.empty()) {
            return "unknown";
        }

        std::string out;
        out.reserve(remote_addr.size());
        for (char c : remote_addr) {
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
            if (!is_addr_char(c)) {
                return "unknown";
            }
            out.push_back(c);
        }
        return out;
    }

    seedvault::core::Status fingerprint_hash(std::string_view normalized_addr, seedvault::core::Hash256* out) noexcept {
        if (out == nullptr) {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Invalid);
        }

        blake3_hasher h;
        blake3_hasher_init(&h);

        static constexpr char kLabel[] = "seedvault.origin.v1";
        blake3_hasher_update(&h, kLabel, sizeof(kLabel) - 1);
        update_field(&h, normalized_addr);

        blake3_hasher_finalize(&h, out->b.data(), out->b.size());
        return seedvault::core::ok_status();
    }

    std::string origin_fingerprint(std::string_view remote_addr) {
        static constexpr char kHex[] = "0123456789abcdef";

        const std::string addr = normalize_client_address(remote_addr);
        seedvault::core::Hash256 digest{};
        if (!seedvault::core::is_ok(fingerprint_hash(addr, &digest))) {
            return "fp_unknown";
        }

        std::string fp = "fp_";
        fp.reserve(3 + 2 * kFingerprintBytes);
        for (std::size_t i = 0; i < kFingerprintBytes; ++i) {
            fp.push_back(kHex[digest.b[i] >> 4]);
            fp.push_back(kHex[digest.b[i] & 0x0f]);
        }
        return fp;
    }
} // namespace seedvault::security
