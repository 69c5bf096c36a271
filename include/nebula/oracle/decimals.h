// NEBULA - Decimal Normalization
// Copyright (c) 2024 NEBULA Developers
// MIT License
//
// Lifts token amounts and feed answers from their native decimal count into
// the canonical 18-decimal fixed-point representation.

#ifndef NEBULA_ORACLE_DECIMALS_H
#define NEBULA_ORACLE_DECIMALS_H

#include <nebula/core/types.h>
#include <nebula/oracle/interfaces.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>

namespace nebula {
namespace oracle {

/// Largest decimal count that can be lifted to 18 decimals
constexpr unsigned MAX_DECIMALS = 18;

/**
 * Per-address scalar cache.
 *
 * The scalar of an address with `d` decimals is 10^(18 - d). Scalars are
 * computed once, usually at registration, and read on every price query.
 */
class DecimalNormalizer {
public:
    DecimalNormalizer() = default;

    /**
     * Scalar for a decimal count, without touching the cache.
     *
     * @throws OracleError DecimalsZero when decimals == 0,
     *         DecimalsTooLarge when decimals > 18
     */
    static UInt256 ScalarFor(unsigned decimals);

    /// Compute, cache and return the scalar of `key`
    UInt256 ComputeScalar(const Address& key, unsigned decimals);

    /// Same, querying the asset's decimals
    UInt256 ComputeScalar(const Address& key, const IAsset& asset);

    /// Same, querying the feed's decimals
    UInt256 ComputeScalar(const Address& key, const IPriceFeed& feed);

    /// Store an already validated scalar
    void Store(const Address& key, const UInt256& scalar);

    /**
     * amount * scalar(key).
     *
     * An address whose scalar was never computed has scalar 0, so the
     * result is 0. Scalar 1 returns the amount untouched.
     *
     * @throws OracleError ArithmeticOverflow if the product exceeds 256 bits
     */
    UInt256 Normalize(const Address& key, const UInt256& amount) const;

    std::optional<UInt256> GetScalar(const Address& key) const;
    bool HasScalar(const Address& key) const;
    size_t Size() const;

private:
    std::map<Address, UInt256> scalars_;
    mutable std::mutex mutex_;
};

} // namespace oracle
} // namespace nebula

#endif // NEBULA_ORACLE_DECIMALS_H
