// NEBULA - Host Ledger Capabilities
// Copyright (c) 2024 NEBULA Developers
// MIT License
//
// Abstract views of the ledger contracts the oracle consumes: ERC20-like
// assets, aggregator-style price feeds and constant-product pools. The
// oracle never implements these; it resolves them by address through an
// IChainView supplied by the host.

#ifndef NEBULA_ORACLE_INTERFACES_H
#define NEBULA_ORACLE_INTERFACES_H

#include <nebula/core/types.h>

#include <cstdint>
#include <memory>
#include <string>

namespace nebula {
namespace oracle {

// ============================================================================
// Asset
// ============================================================================

/// ERC20-like token
class IAsset {
public:
    virtual ~IAsset() = default;

    /// Number of decimals the token's amounts are expressed in
    virtual uint8_t Decimals() const = 0;

    /// Human-readable name
    virtual std::string Name() const = 0;

    /// Total supply in the token's own decimals
    virtual UInt256 TotalSupply() const = 0;
};

// ============================================================================
// Price Feed
// ============================================================================

/// Latest round reported by a price feed
struct RoundData {
    uint64_t roundId{0};

    /// Price with the feed's own decimals; negative only on a feed anomaly
    Int256 answer{0};

    Timestamp startedAt{0};
    Timestamp updatedAt{0};
    uint64_t answeredInRound{0};
};

/// Aggregator-style external price feed
class IPriceFeed {
public:
    virtual ~IPriceFeed() = default;

    virtual uint8_t Decimals() const = 0;

    virtual RoundData LatestRoundData() const = 0;

    /// Feed description ("ETH / USD")
    virtual std::string Description() const = 0;
};

// ============================================================================
// Pool
// ============================================================================

/// Pool reserves as reported by the pool
struct Reserves {
    /// Each reserve fits in 112 bits
    UInt256 reserve0{0};
    UInt256 reserve1{0};

    /// Last time the reserves were synced
    uint32_t blockTimestampLast{0};
};

/**
 * Constant-product liquidity pool. The pool is itself the liquidity token,
 * so it is also an IAsset whose total supply is the LP supply.
 */
class IPool : public IAsset {
public:
    virtual Reserves GetReserves() const = 0;

    virtual Address Token0() const = 0;
    virtual Address Token1() const = 0;

    /**
     * The pool's own reentrancy lock.
     *
     * @return true while the pool is executing one of its mutating
     *         operations (reserves may be transiently inconsistent)
     */
    virtual bool IsLocked() const = 0;
};

// ============================================================================
// Chain View
// ============================================================================

/**
 * Resolves addresses to contract capabilities.
 *
 * Each lookup returns null when nothing with that capability lives at the
 * address.
 */
class IChainView {
public:
    virtual ~IChainView() = default;

    virtual std::shared_ptr<const IAsset> GetAsset(const Address& addr) const = 0;
    virtual std::shared_ptr<const IPriceFeed> GetFeed(const Address& addr) const = 0;
    virtual std::shared_ptr<const IPool> GetPool(const Address& addr) const = 0;
};

} // namespace oracle
} // namespace nebula

#endif // NEBULA_ORACLE_INTERFACES_H
