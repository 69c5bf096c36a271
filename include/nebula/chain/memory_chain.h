// NEBULA - In-Memory Ledger
// Copyright (c) 2024 NEBULA Developers
// MIT License
//
// Process-local implementations of the ledger capabilities. Used by tests and
// simulations to stand up assets, feeds and pools with settable state.

#ifndef NEBULA_CHAIN_MEMORY_CHAIN_H
#define NEBULA_CHAIN_MEMORY_CHAIN_H

#include <nebula/core/types.h>
#include <nebula/oracle/interfaces.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace nebula {
namespace chain {

// ============================================================================
// Memory Asset
// ============================================================================

class MemoryAsset : public oracle::IAsset {
public:
    MemoryAsset(std::string name, uint8_t decimals, UInt256 totalSupply = 0);

    uint8_t Decimals() const override;
    std::string Name() const override;
    UInt256 TotalSupply() const override;

    void SetDecimals(uint8_t decimals);
    void SetTotalSupply(const UInt256& supply);

private:
    std::string name_;
    uint8_t decimals_;
    UInt256 totalSupply_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Memory Price Feed
// ============================================================================

class MemoryPriceFeed : public oracle::IPriceFeed {
public:
    MemoryPriceFeed(std::string description, uint8_t decimals, const Int256& answer);

    uint8_t Decimals() const override;
    oracle::RoundData LatestRoundData() const override;
    std::string Description() const override;

    /// Report a new answer; starts a new round stamped with `updatedAt`
    void SetAnswer(const Int256& answer, Timestamp updatedAt = 0);

    /// Number of LatestRoundData() calls so far
    uint64_t ReadCount() const;

private:
    std::string description_;
    uint8_t decimals_;
    oracle::RoundData round_;
    mutable uint64_t reads_{0};
    mutable std::mutex mutex_;
};

// ============================================================================
// Memory Pool
// ============================================================================

class MemoryPool : public oracle::IPool {
public:
    MemoryPool(std::string name, const Address& token0, const Address& token1);

    // IAsset: LP tokens always carry 18 decimals
    uint8_t Decimals() const override { return 18; }
    std::string Name() const override;
    UInt256 TotalSupply() const override;

    oracle::Reserves GetReserves() const override;
    Address Token0() const override;
    Address Token1() const override;
    bool IsLocked() const override;

    /// Set both reserves. Throws std::out_of_range above 2^112 - 1.
    void SetReserves(const UInt256& reserve0, const UInt256& reserve1,
                     uint32_t timestamp = 0);
    void SetTotalSupply(const UInt256& supply);

    /// Simulate being inside a swap/mint/burn
    void SetLocked(bool locked);

private:
    std::string name_;
    Address token0_;
    Address token1_;
    oracle::Reserves reserves_;
    UInt256 totalSupply_{0};
    bool locked_{false};
    mutable std::mutex mutex_;
};

// ============================================================================
// Memory Chain
// ============================================================================

/**
 * Address book of in-memory contracts.
 *
 * A pool is also reachable as an asset, since it is its own liquidity token.
 */
class MemoryChain : public oracle::IChainView {
public:
    MemoryChain() = default;

    void AddAsset(const Address& addr, std::shared_ptr<MemoryAsset> asset);
    void AddFeed(const Address& addr, std::shared_ptr<MemoryPriceFeed> feed);
    void AddPool(const Address& addr, std::shared_ptr<MemoryPool> pool);

    /// Remove whatever is deployed at `addr`
    void Remove(const Address& addr);

    std::shared_ptr<const oracle::IAsset> GetAsset(const Address& addr) const override;
    std::shared_ptr<const oracle::IPriceFeed> GetFeed(const Address& addr) const override;
    std::shared_ptr<const oracle::IPool> GetPool(const Address& addr) const override;

private:
    std::map<Address, std::shared_ptr<MemoryAsset>> assets_;
    std::map<Address, std::shared_ptr<MemoryPriceFeed>> feeds_;
    std::map<Address, std::shared_ptr<MemoryPool>> pools_;
    mutable std::mutex mutex_;
};

} // namespace chain
} // namespace nebula

#endif // NEBULA_CHAIN_MEMORY_CHAIN_H
