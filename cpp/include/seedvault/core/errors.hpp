#pragma once
#include <cstdint>
#include <type_traits>

namespace seedvault::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        Conflict,
        Busy,
        Crypto,
        Unsupported,
        Unavailable,
        WeakParameters,
        Authentication,
        Locked,
        Transport,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Security,
        Db,
        Vault,
        Cli,
        Bindings,
        External,
    };

    // aux carries a code-specific hint: remaining lock seconds for Locked,
    // the sqlite result code for Transport.
    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    [[nodiscard]] constexpr const char* status_code_name(StatusCode c) noexcept {
        switch (c) {
            case StatusCode::Ok: return "ok";
            case StatusCode::Unknown: return "unknown";
            case StatusCode::Invalid: return "invalid input";
            case StatusCode::NotFound: return "not found";
            case StatusCode::Conflict: return "conflict";
            case StatusCode::Busy: return "busy";
            case StatusCode::Crypto: return "crypto failure";
            case StatusCode::Unsupported: return "unsupported";
            case StatusCode::Unavailable: return "unavailable";
            case StatusCode::WeakParameters: return "weak parameters";
            case StatusCode::Authentication: return "authentication failed";
            case StatusCode::Locked: return "locked";
            case StatusCode::Transport: return "transport failure";
        }
        return "unknown";
    }

    [[nodiscard]] constexpr const char* status_domain_name(StatusDomain d) noexcept {
        switch (d) {
            case StatusDomain::Core: return "core";
            case StatusDomain::Security: return "security";
            case StatusDomain::Db: return "db";
            case StatusDomain::Vault: return "vault";
            case StatusDomain::Cli: return "cli";
            case StatusDomain::Bindings: return "bindings";
            case StatusDomain::External: return "external";
        }
        return "unknown";
    }

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace seedvault::core
