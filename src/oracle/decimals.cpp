// NEBULA - Decimal Normalization Implementation
// Copyright (c) 2024 NEBULA Developers
// MIT License

#include "nebula/oracle/decimals.h"
#include "nebula/core/errors.h"
#include "nebula/math/fixed_point.h"
#include "nebula/util/logging.h"

namespace nebula {
namespace oracle {

UInt256 DecimalNormalizer::ScalarFor(unsigned decimals) {
    if (decimals == 0) {
        throw OracleError(OracleErrc::DecimalsZero);
    }
    if (decimals > MAX_DECIMALS) {
        throw OracleError(OracleErrc::DecimalsTooLarge,
                          std::to_string(decimals) + " decimals");
    }
    return math::Pow10(MAX_DECIMALS - decimals);
}

UInt256 DecimalNormalizer::ComputeScalar(const Address& key, unsigned decimals) {
    UInt256 scalar;
    try {
        scalar = ScalarFor(decimals);
    } catch (const OracleError& e) {
        LOG_WARN(util::LogCategory::FEED) << "Rejecting decimals of "
                                          << key.ToShortHex() << ": " << e.what();
        throw;
    }
    Store(key, scalar);
    return scalar;
}

UInt256 DecimalNormalizer::ComputeScalar(const Address& key, const IAsset& asset) {
    return ComputeScalar(key, asset.Decimals());
}

UInt256 DecimalNormalizer::ComputeScalar(const Address& key, const IPriceFeed& feed) {
    return ComputeScalar(key, feed.Decimals());
}

void DecimalNormalizer::Store(const Address& key, const UInt256& scalar) {
    std::lock_guard<std::mutex> lock(mutex_);
    scalars_[key] = scalar;
}

UInt256 DecimalNormalizer::Normalize(const Address& key, const UInt256& amount) const {
    UInt256 scalar;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = scalars_.find(key);
        if (it != scalars_.end()) {
            scalar = it->second;
        }
    }

    if (scalar == 1) {
        return amount;
    }
    if (scalar != 0 && amount > MaxUInt256() / scalar) {
        LOG_ERROR(util::LogCategory::FEED) << "Normalizing " << amount << " for "
                                           << key.ToShortHex() << " overflows";
        throw OracleError(OracleErrc::ArithmeticOverflow, "normalize");
    }
    return amount * scalar;
}

std::optional<UInt256> DecimalNormalizer::GetScalar(const Address& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = scalars_.find(key);
    if (it == scalars_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool DecimalNormalizer::HasScalar(const Address& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scalars_.count(key) > 0;
}

size_t DecimalNormalizer::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scalars_.size();
}

} // namespace oracle
} // namespace nebula
