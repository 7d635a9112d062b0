#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>
#include <string_view>

namespace seedvault::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Milliseconds since the Unix epoch.
    using Timestamp = i64;

    inline constexpr i64 kMillisPerSecond = 1000;
    inline constexpr i64 kMillisPerMinute = 60 * kMillisPerSecond;
    inline constexpr i64 kMillisPerHour = 60 * kMillisPerMinute;

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
        friend constexpr auto operator<=>(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);

    template <typename Tag, typename Repr>
    struct Id {
        Repr v{};

        static constexpr Id invalid() noexcept { return Id{Repr(0)}; }
        [[nodiscard]] constexpr bool is_valid() const noexcept { return v != invalid().v; }

        friend constexpr bool operator==(Id, Id) noexcept = default;
        friend constexpr auto operator<=>(Id, Id) noexcept = default;
    };

    // Rowids start at 1, so 0 doubles as "no account".
    struct AccountIdTag {};
    using AccountId = Id<AccountIdTag, u64>;

    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u32 len{0};
    };

    [[nodiscard]] constexpr bool buffer_ok(BufferView b) noexcept {
        return (b.len == 0) || (b.data != nullptr);
    }

    [[nodiscard]] constexpr bool buffer_ok(BufferMut b) noexcept {
        return (b.len == 0) || (b.data != nullptr);
    }

    // Upper bound for any single payload handed to the codec (vault documents
    // are a few KiB in practice).
    inline constexpr std::size_t kMaxPayloadBytes = 16u * 1024u * 1024u;

    // Callers bound s by kMaxPayloadBytes first.
    [[nodiscard]] inline BufferView view_of(std::string_view s) noexcept {
        return BufferView{reinterpret_cast<const u8*>(s.data()), static_cast<u32>(s.size())};
    }

    static_assert(std::is_trivially_copyable_v<AccountId>);
    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferMut>);

} // namespace seedvault::core
