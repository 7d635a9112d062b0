#include "seedvault/encoding/base64.hpp"

#include <cstddef>

#include <openssl/evp.h>

namespace seedvault::encoding {
    namespace {
        [[nodiscard]] seedvault::core::Status invalid() noexcept {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Core, seedvault::core::StatusCode::Invalid);
        }

        [[nodiscard]] bool is_b64_char(char c) noexcept {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
        }

        // Returns the padding count, or -1 when the text is not canonical base64.
        [[nodiscard]] int validate(std::string_view in) noexcept {
            if (in.size() % 4 != 0) {
                return -1;
            }
            int pad = 0;
            for (size_t i = 0; i < in.size(); ++i) {
                const char c = in[i];
                if (c == '=') {
                    if (i + 2 < in.size()) {
                        return -1;
                    }
                    ++pad;
                    continue;
                }
                if (pad > 0 || !is_b64_char(c)) {
                    return -1;
                }
            }
            return pad;
        }
    } // namespace

    seedvault::core::Status base64_encode(BufferView in, std::string* out) noexcept {
        if (out == nullptr || !seedvault::core::buffer_ok(in)) {
            return invalid();
        }
        out->clear();
        if (in.len == 0) {
            return seedvault::core::ok_status();
        }

        const size_t encoded_len = 4 * ((static_cast<size_t>(in.len) + 2) / 3);
        out->resize(encoded_len + 1);
        const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out->data()), in.data, static_cast<int>(in.len));
        if (n < 0 || static_cast<size_t>(n) != encoded_len) {
            out->clear();
            return seedvault::core::make_status(seedvault::core::StatusDomain::External, seedvault::core::StatusCode::Unknown);
        }
        out->resize(encoded_len);
        return seedvault::core::ok_status();
    }

    seedvault::core::Status base64_decode(std::string_view in, std::vector<u8>* out) noexcept {
        if (out == nullptr) {
            return invalid();
        }
        out->clear();
        const int pad = validate(in);
        if (pad < 0) {
            return invalid();
        }
        if (in.empty()) {
            return seedvault::core::ok_status();
        }

        out->resize(in.size() / 4 * 3);
        const int n = EVP_DecodeBlock(out->data(), reinterpret_cast<const unsigned char*>(in.data()), static_cast<int>(in.size()));
        if (n < 0 || static_cast<size_t>(n) != out->size()) {
            out->clear();
            return invalid();
        }
        // EVP_DecodeBlock keeps the zero bytes produced by padding.
        out->resize(out->size() - static_cast<size_t>(pad));
        return seedvault::core::ok_status();
    }

    seedvault::core::Status base64url_encode(BufferView in, std::string* out) noexcept {
        const seedvault::core::Status s = base64_encode(in, out);
        if (!seedvault::core::is_ok(s)) {
            return s;
        }
        while (!out->empty() && out->back() == '=') {
            out->pop_back();
        }
        for (char& c : *out) {
            if (c == '+') {
                c = '-';
            } else if (c == '/') {
                c = '_';
            }
        }
        return seedvault::core::ok_status();
    }

    seedvault::core::Status base64url_decode(std::string_view in, std::vector<u8>* out) noexcept {
        if (out == nullptr) {
            return invalid();
        }
        if (in.size() % 4 == 1) {
            out->clear();
            return invalid();
        }
        std::string std_form(in);
        for (char& c : std_form) {
            if (c == '-') {
                c = '+';
            } else if (c == '_') {
                c = '/';
            } else if (c == '+' || c == '/' || c == '=') {
                out->clear();
                return invalid();
            }
        }
        while (std_form.size() % 4 != 0) {
            std_form.push_back('=');
        }
        return base64_decode(std_form, out);
    }

    bool base64_is_valid(std::string_view in) noexcept {
        return validate(in) >= 0;
    }
} // namespace seedvault::encoding
