#pragma once

#include <string>
#include <vector>

#include "seedvault/core/errors.hpp"
#include "seedvault/core/types.hpp"

namespace seedvault::security {
    using u8 = seedvault::core::u8;
    using u32 = seedvault::core::u32;
    using BufferView = seedvault::core::BufferView;
    using BufferMut = seedvault::core::BufferMut;

    // 256-bit symmetric key produced by derive_key. Move-only; the bytes are
    // wiped on destruction and on move-from.
    class DerivedKey {
    public:
        static constexpr u32 kSize = 32;

        DerivedKey() noexcept = default;
        ~DerivedKey();

        DerivedKey(const DerivedKey&) = delete;
        DerivedKey& operator=(const DerivedKey&) = delete;

        DerivedKey(DerivedKey&& other) noexcept;
        DerivedKey& operator=(DerivedKey&& other) noexcept;

        // Raw key import (tests and benchmarks); len must be kSize.
        [[nodiscard]] static seedvault::core::Status from_bytes(BufferView raw, DerivedKey* out) noexcept;

        [[nodiscard]] const u8* data() const noexcept { return b_; }
        [[nodiscard]] BufferMut writable() noexcept;
        [[nodiscard]] bool is_set() const noexcept { return set_; }

        void wipe() noexcept;

    private:
        u8 b_[kSize]{};
        bool set_{false};
    };

    void wipe_bytes(void* p, std::size_t len) noexcept;
    void wipe_string(std::string* s) noexcept;
    void wipe_vector(std::vector<u8>* v) noexcept;

    // Constant-time equality for equal-length secrets. Different lengths
    // compare unequal without touching the contents.
    [[nodiscard]] bool equal_ct(BufferView a, BufferView b) noexcept;

} // namespace seedvault::security
