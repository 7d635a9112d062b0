#pragma once

#include <string>
#include <string_view>
#include <type_traits>

#include "seedvault/core/errors.hpp"
#include "seedvault/core/types.hpp"
#include "seedvault/vault/service.hpp"

namespace seedvault::bindings::http {
    using u16 = seedvault::core::u16;
    using u32 = seedvault::core::u32;

    inline constexpr std::size_t kMaxBodyBytes = 10u * 1024u * 1024u;

    struct HttpHeader {
        std::string_view name{};
        std::string_view value{};
    };

    // Views into a request owned by the caller's server loop.
    struct HttpRequest {
        std::string_view method{};
        std::string_view path{};
        std::string_view body{};
        const HttpHeader* headers{nullptr};
        u32 header_count{0};
        std::string_view remote_addr{};
    };

    struct HttpResponse {
        u16 status{200};
        std::string body; // JSON
    };

    // 400 Invalid, 401 Authentication, 404 NotFound, 409 Conflict,
    // 423 Locked, 503 Transport/Unavailable, 500 anything else.
    [[nodiscard]] u16 http_status_for(seedvault::core::Status s) noexcept;

    // Case-insensitive lookup; empty when absent.
    [[nodiscard]] std::string_view find_header(const HttpRequest& req, std::string_view name) noexcept;

    // Routes one request to the service:
    //   GET    /health
    //   POST   /auth/register, /auth/login
    //   GET    /vault, /vault/export
    //   POST   /vault
    //   DELETE /vault
    // Vault routes need "Authorization: Bearer <token>". The returned status
    // is the service outcome; out->status is always set.
    seedvault::core::Status handle_http_request(seedvault::vault::VaultService& service,
        const HttpRequest& req,
        HttpResponse* out) noexcept;

    static_assert(std::is_trivially_copyable_v<HttpHeader>);
    static_assert(std::is_trivially_copyable_v<HttpRequest>);

} // namespace seedvault::bindings::http
