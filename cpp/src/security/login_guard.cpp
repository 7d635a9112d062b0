#include "seedvault/security/login_guard.hpp"

#include <algorithm>

namespace seedvault::security {
    namespace {
        [[nodiscard]] LockState merge(LockState a, LockState b) noexcept {
            return LockState{a.locked || b.locked, std::max(a.locked ? a.remaining_ms : 0, b.locked ? b.remaining_ms : 0)};
        }

        [[nodiscard]] seedvault::core::Status locked_status(LockState st) noexcept {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security,
                seedvault::core::StatusCode::Locked, remaining_seconds(st.remaining_ms));
        }

        // Saturated: every remaining slot is held by a check still running.
        [[nodiscard]] seedvault::core::Status refused(Admission why, LockState st) noexcept {
            if (why == Admission::Locked) {
                return locked_status(st);
            }
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Busy);
        }
    } // namespace

    LockState LoginGuard::check(std::string_view account_key, std::string_view origin_key) const {
        return merge(accounts_.is_locked(account_key), origins_.is_locked(origin_key));
    }

    seedvault::core::Status LoginGuard::attempt(std::string_view account_key,
        std::string_view origin_key,
        const std::function<bool()>& verify) {
        const LockState before = check(account_key, origin_key);
        if (before.locked) {
            return locked_status(before);
        }
        if (!verify) {
            return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Invalid);
        }

        LockState held{};
        const Admission acct = accounts_.begin_attempt(account_key, &held);
        if (acct != Admission::Admitted) {
            return refused(acct, merge(held, check(account_key, origin_key)));
        }
        const Admission origin = origins_.begin_attempt(origin_key, &held);
        if (origin != Admission::Admitted) {
            accounts_.cancel_attempt(account_key);
            return refused(origin, merge(held, check(account_key, origin_key)));
        }

        const bool ok = verify();
        const LockState after = merge(accounts_.finish_attempt(account_key, ok), origins_.finish_attempt(origin_key, ok));
        if (ok) {
            return seedvault::core::ok_status();
        }
        if (after.locked) {
            return locked_status(after);
        }
        return seedvault::core::make_status(seedvault::core::StatusDomain::Security, seedvault::core::StatusCode::Authentication);
    }
} // namespace seedvault::security
