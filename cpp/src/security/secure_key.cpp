#include "seedvault/security/secure_key.hpp"

#include <cstring>

#include <sodium.h>

namespace seedvault::security {
    DerivedKey::~DerivedKey() {
        wipe();
    }

    DerivedKey::DerivedKey(DerivedKey&& other) noexcept : set_(other.set_) {
        std::memcpy(b_, other.b_, kSize);
        other.wipe();
    }

    DerivedKey& DerivedKey::operator=(DerivedKey&& other) noexcept {
        if (this != &other) {
            std::memcpy(b_, other.b_, kSize);
            set_ = other.set_;
            other.wipe();
        }
        return *this;
    }

    seedvault::core::Status DerivedKey::from_bytes(BufferView raw, DerivedKey* out) noexcept {
        if (out == nullptr || raw.data == nullptr || raw.len != kSize) {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Invalid);
        }
        std::memcpy(out->b_, raw.data, kSize);
        out->set_ = true;
        return seedvault::core::ok_status();
    }

    BufferMut DerivedKey::writable() noexcept {
        set_ = true;
        return BufferMut{b_, kSize};
    }

    void DerivedKey::wipe() noexcept {
        sodium_memzero(b_, kSize);
        set_ = false;
    }

    void wipe_bytes(void* p, std::size_t len) noexcept {
        if (p != nullptr && len > 0) {
            sodium_memzero(p, len);
        }
    }

    void wipe_string(std::string* s) noexcept {
        if (s == nullptr) {
            return;
        }
        wipe_bytes(s->data(), s->size());
        s->clear();
    }

    void wipe_vector(std::vector<u8>* v) noexcept {
        if (v == nullptr) {
            return;
        }
        wipe_bytes(v->data(), v->size());
        v->clear();
    }

    bool equal_ct(BufferView a, BufferView b) noexcept {
        if (a.len != b.len) {
            return false;
        }
        if (a.len == 0) {
            return true;
        }
        if (a.data == nullptr || b.data == nullptr) {
            return false;
        }
        return sodium_memcmp(a.data, b.data, a.len) == 0;
    }
} // namespace seedvault::security
