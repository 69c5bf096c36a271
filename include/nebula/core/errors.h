// NEBULA - Oracle Error Codes
// Copyright (c) 2024 NEBULA Developers
// MIT License
//
// Every rejected operation surfaces as an OracleError carrying one of the
// codes below. Rejections happen before any state is touched.

#ifndef NEBULA_CORE_ERRORS_H
#define NEBULA_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace nebula {

// ============================================================================
// Error Codes
// ============================================================================

enum class OracleErrc {
    // State preconditions
    PairAlreadyInitialized,
    PairNotInitialized,
    OracleAlreadyAdded,
    NebulaNotFound,

    // Authorization
    MsgSenderNotAdmin,
    MsgSenderNotRegistrar,

    // Admin transfer
    PendingAdminAlreadySet,
    AdminCantBeZero,

    // Arithmetic
    ArithmeticOverflow,
    DivisionByZero,
    InvalidDomain,

    // Decimals
    DecimalsZero,
    DecimalsTooLarge,

    // Feeds
    InvalidFeedValue,
    InvalidFeedCount,

    // Reentrancy
    AlreadyInContext,

    // Degenerate results
    PriceCantBeZero,

    // Host environment
    UnknownContract,
};

/// Stable name of an error code
const char* OracleErrcToString(OracleErrc code);

// ============================================================================
// OracleError
// ============================================================================

/// Exception thrown by every oracle, registry and math operation
class OracleError : public std::runtime_error {
public:
    explicit OracleError(OracleErrc code);
    OracleError(OracleErrc code, const std::string& detail);

    OracleErrc code() const noexcept { return code_; }

private:
    OracleErrc code_;
};

} // namespace nebula

#endif // NEBULA_CORE_ERRORS_H
