#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "seedvault/core/errors.hpp"
#include "seedvault/core/types.hpp"

namespace seedvault::encoding {
    using u8 = seedvault::core::u8;
    using BufferView = seedvault::core::BufferView;

    // RFC 4648 standard alphabet with padding.
    seedvault::core::Status base64_encode(BufferView in, std::string* out) noexcept;

    // Strict: rejects whitespace, bad characters, misplaced padding and
    // lengths that are not a multiple of four.
    seedvault::core::Status base64_decode(std::string_view in, std::vector<u8>* out) noexcept;

    // URL-safe alphabet, no padding (token segments).
    seedvault::core::Status base64url_encode(BufferView in, std::string* out) noexcept;
    seedvault::core::Status base64url_decode(std::string_view in, std::vector<u8>* out) noexcept;

    [[nodiscard]] bool base64_is_valid(std::string_view in) noexcept;

} // namespace seedvault::encoding
