#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "seedvault/cli/options.hpp"
#include "seedvault/core/errors.hpp"
#include "seedvault/security/kdf.hpp"

namespace seedvault::cli {
    using u32 = seedvault::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Seal = 2,
        Open = 3,
        Export = 4,
        Import = 5,
        Strength = 6,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    seedvault::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    // --iterations, bounded below by the KDF floor (WeakParameters).
    seedvault::core::Status kdf_params_from_options(const ParsedOptions& opts, seedvault::security::KdfParams* out) noexcept;

    // seal: vault document in, {"encryptedData","clientSalt"} out. The
    // document must be JSON and the password must meet the master policy.
    seedvault::core::Status run_seal(std::string_view password,
        std::string_view document,
        const seedvault::security::KdfParams& params,
        std::string* out) noexcept;

    // open: the JSON written by seal in, the document out. Authentication on
    // a wrong password or tampering, Invalid on unreadable input.
    seedvault::core::Status run_open(std::string_view password,
        std::string_view sealed_json,
        const seedvault::security::KdfParams& params,
        std::string* out) noexcept;

    // "<score>/5 <label>"
    [[nodiscard]] std::string strength_line(std::string_view password);

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace seedvault::cli
