// NEBULA - Two-Step Admin Control Implementation
// Copyright (c) 2024 NEBULA Developers
// MIT License

#include "nebula/oracle/admin.h"
#include "nebula/core/errors.h"
#include "nebula/util/logging.h"

namespace nebula {
namespace oracle {

AdminControl::AdminControl(const Address& admin) : admin_(admin) {}

void AdminControl::RequireAdmin(const Address& caller, const char* category,
                                const char* action) const {
    if (!IsAdmin(caller)) {
        LOG_WARN(category) << action << ": " << caller.ToShortHex() << " is not admin";
        throw OracleError(OracleErrc::MsgSenderNotAdmin, action);
    }
}

Address AdminControl::ProposeAdmin(const Address& caller, const Address& candidate,
                                   const char* category) {
    RequireAdmin(caller, category, "proposeAdmin");

    if (candidate == pendingAdmin_) {
        LOG_WARN(category) << "proposeAdmin: " << candidate.ToShortHex()
                           << " is already pending";
        throw OracleError(OracleErrc::PendingAdminAlreadySet, candidate.ToHex());
    }

    Address previous = pendingAdmin_;
    pendingAdmin_ = candidate;

    LOG_INFO(category) << "Pending admin " << previous.ToShortHex()
                       << " -> " << candidate.ToShortHex();
    return previous;
}

Address AdminControl::AcceptAdmin(const Address& caller, const char* category) {
    if (!IsAdmin(caller) && (pendingAdmin_.IsNull() || caller != pendingAdmin_)) {
        LOG_WARN(category) << "acceptAdmin: " << caller.ToShortHex()
                           << " is neither admin nor pending admin";
        throw OracleError(OracleErrc::MsgSenderNotAdmin, "acceptAdmin");
    }

    if (pendingAdmin_.IsNull()) {
        LOG_WARN(category) << "acceptAdmin: no pending admin";
        throw OracleError(OracleErrc::AdminCantBeZero);
    }

    Address previous = admin_;
    admin_ = pendingAdmin_;
    pendingAdmin_.SetNull();

    LOG_INFO(category) << "Admin " << previous.ToShortHex()
                       << " -> " << admin_.ToShortHex();
    return previous;
}

} // namespace oracle
} // namespace nebula
