// NEBULA - Two-Step Admin Control
// Copyright (c) 2024 NEBULA Developers
// MIT License

#ifndef NEBULA_ORACLE_ADMIN_H
#define NEBULA_ORACLE_ADMIN_H

#include <nebula/core/types.h>

#include <functional>
#include <string>

namespace nebula {
namespace oracle {

/**
 * Admin role with a two-step transfer.
 *
 * The admin proposes a candidate, then the transfer is accepted, which
 * promotes the candidate and clears the pending slot. Authorization is a
 * pure function of the held state and the caller passed in.
 *
 * Not thread-safe on its own; owners guard it with their own mutex.
 */
class AdminControl {
public:
    /// Invoked with (previous, next) on every change
    using ChangeCallback = std::function<void(const Address&, const Address&)>;

    explicit AdminControl(const Address& admin);

    const Address& Admin() const { return admin_; }
    const Address& PendingAdmin() const { return pendingAdmin_; }

    bool IsAdmin(const Address& caller) const { return !caller.IsNull() && caller == admin_; }

    /**
     * Throw MsgSenderNotAdmin unless `caller` is the admin.
     *
     * @param category Log category of the owner
     * @param action Operation name for the log line
     */
    void RequireAdmin(const Address& caller, const char* category, const char* action) const;

    /**
     * Stage `candidate` as the next admin.
     *
     * @throws OracleError MsgSenderNotAdmin, or PendingAdminAlreadySet when
     *         `candidate` is already pending
     * @return The previously pending admin
     */
    Address ProposeAdmin(const Address& caller, const Address& candidate, const char* category);

    /**
     * Promote the pending admin. Callable by the admin or by the pending
     * admin itself.
     *
     * @throws OracleError MsgSenderNotAdmin, or AdminCantBeZero when nothing
     *         is pending
     * @return The previous admin
     */
    Address AcceptAdmin(const Address& caller, const char* category);

private:
    Address admin_;
    Address pendingAdmin_;
};

} // namespace oracle
} // namespace nebula

#endif // NEBULA_ORACLE_ADMIN_H
