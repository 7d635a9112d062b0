#include "seedvault/security/token.hpp"

#include <array>
#include <charconv>
#include <limits>
#include <system_error>
#include <utility>
#include <vector>

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "seedvault/encoding/base64.hpp"
#include "seedvault/security/secure_key.hpp"

namespace seedvault::security {
    namespace {
        using Mac = std::array<u8, 32>;

        [[nodiscard]] bool token_mac(std::string_view secret, std::string_view body, Mac* out) noexcept {
            unsigned int len = 0;
            const unsigned char* r = HMAC(EVP_sha256(),
                secret.data(), static_cast<int>(secret.size()),
                reinterpret_cast<const unsigned char*>(body.data()), body.size(),
                out->data(), &len);
            return r != nullptr && len == out->size();
        }

        template <typename T>
        [[nodiscard]] bool parse_decimal(std::string_view s, T* out) noexcept {
            if (s.empty() || s.size() > 20 || (s.size() > 1 && s.front() == '0')) {
                return false;
            }
            const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), *out);
            return ec == std::errc() && ptr == s.data() + s.size();
        }

        [[nodiscard]] seedvault::core::Status auth_failed() noexcept {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Authentication);
        }
    } // namespace

    seedvault::core::Status issue_token(std::string_view secret,
        seedvault::core::AccountId account,
        seedvault::core::Timestamp now,
        seedvault::core::i64 ttl_ms,
        std::string* out) noexcept {
        if (out == nullptr || secret.empty() || !account.is_valid() || ttl_ms <= 0 || now < 0) {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Invalid);
        }
        if (ttl_ms > std::numeric_limits<seedvault::core::i64>::max() - now) {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Invalid);
        }

        std::string body(kTokenVersion);
        body += '.';
        body += std::to_string(account.v);
        body += '.';
        body += std::to_string(now + ttl_ms);

        Mac mac{};
        if (!token_mac(secret, body, &mac)) {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Crypto);
        }
        std::string sig;
        const seedvault::core::Status s = seedvault::encoding::base64url_encode(BufferView{mac.data(), static_cast<u32>(mac.size())}, &sig);
        if (!seedvault::core::is_ok(s)) {
            return s;
        }

        body += '.';
        body += sig;
        *out = std::move(body);
        return seedvault::core::ok_status();
    }

    seedvault::core::Status verify_token(std::string_view secret,
        std::string_view token,
        seedvault::core::Timestamp now,
        seedvault::core::AccountId* out) noexcept {
        if (out == nullptr || secret.empty() || token.size() > 256) {
            return auth_failed();
        }

        const std::size_t p1 = token.find('.');
        const std::size_t p2 = p1 == std::string_view::npos ? p1 : token.find('.', p1 + 1);
        const std::size_t p3 = p2 == std::string_view::npos ? p2 : token.find('.', p2 + 1);
        if (p3 == std::string_view::npos || token.find('.', p3 + 1) != std::string_view::npos) {
            return auth_failed();
        }
        if (token.substr(0, p1) != kTokenVersion) {
            return auth_failed();
        }

        std::vector<u8> sig;
        if (!seedvault::core::is_ok(seedvault::encoding::base64url_decode(token.substr(p3 + 1), &sig))) {
            return auth_failed();
        }
        Mac expected{};
        if (!token_mac(secret, token.substr(0, p3), &expected)) {
            return auth_failed();
        }
        if (!equal_ct(BufferView{sig.data(), static_cast<u32>(sig.size())},
                BufferView{expected.data(), static_cast<u32>(expected.size())})) {
            return auth_failed();
        }

        seedvault::core::u64 id = 0;
        seedvault::core::i64 expires = 0;
        if (!parse_decimal(token.substr(p1 + 1, p2 - p1 - 1), &id) ||
            !parse_decimal(token.substr(p2 + 1, p3 - p2 - 1), &expires)) {
            return auth_failed();
        }
        if (id == 0 || now >= expires) {
            return auth_failed();
        }

        *out = seedvault::core::AccountId{id};
        return seedvault::core::ok_status();
    }
} // namespace seedvault::security
