// NEBULA - Oracle Error Codes Implementation
// Copyright (c) 2024 NEBULA Developers
// MIT License

#include "nebula/core/errors.h"

namespace nebula {

const char* OracleErrcToString(OracleErrc code) {
    switch (code) {
        case OracleErrc::PairAlreadyInitialized: return "PairAlreadyInitialized";
        case OracleErrc::PairNotInitialized:     return "PairNotInitialized";
        case OracleErrc::OracleAlreadyAdded:     return "OracleAlreadyAdded";
        case OracleErrc::NebulaNotFound:         return "NebulaNotFound";
        case OracleErrc::MsgSenderNotAdmin:      return "MsgSenderNotAdmin";
        case OracleErrc::MsgSenderNotRegistrar:  return "MsgSenderNotRegistrar";
        case OracleErrc::PendingAdminAlreadySet: return "PendingAdminAlreadySet";
        case OracleErrc::AdminCantBeZero:        return "AdminCantBeZero";
        case OracleErrc::ArithmeticOverflow:     return "ArithmeticOverflow";
        case OracleErrc::DivisionByZero:         return "DivisionByZero";
        case OracleErrc::InvalidDomain:          return "InvalidDomain";
        case OracleErrc::DecimalsZero:           return "DecimalsZero";
        case OracleErrc::DecimalsTooLarge:       return "DecimalsTooLarge";
        case OracleErrc::InvalidFeedValue:       return "InvalidFeedValue";
        case OracleErrc::InvalidFeedCount:       return "InvalidFeedCount";
        case OracleErrc::AlreadyInContext:       return "AlreadyInContext";
        case OracleErrc::PriceCantBeZero:        return "PriceCantBeZero";
        case OracleErrc::UnknownContract:        return "UnknownContract";
        default:                                 return "Unknown";
    }
}

OracleError::OracleError(OracleErrc code)
    : std::runtime_error(OracleErrcToString(code)), code_(code) {}

OracleError::OracleError(OracleErrc code, const std::string& detail)
    : std::runtime_error(std::string(OracleErrcToString(code)) + ": " + detail)
    , code_(code) {}

} // namespace nebula
