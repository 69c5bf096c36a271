// NEBULA - In-Memory Ledger Implementation
// Copyright (c) 2024 NEBULA Developers
// MIT License

#include "nebula/chain/memory_chain.h"

#include <stdexcept>
#include <utility>

namespace nebula {
namespace chain {

// ============================================================================
// MemoryAsset
// ============================================================================

MemoryAsset::MemoryAsset(std::string name, uint8_t decimals, UInt256 totalSupply)
    : name_(std::move(name)), decimals_(decimals), totalSupply_(std::move(totalSupply)) {}

uint8_t MemoryAsset::Decimals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return decimals_;
}

std::string MemoryAsset::Name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return name_;
}

UInt256 MemoryAsset::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSupply_;
}

void MemoryAsset::SetDecimals(uint8_t decimals) {
    std::lock_guard<std::mutex> lock(mutex_);
    decimals_ = decimals;
}

void MemoryAsset::SetTotalSupply(const UInt256& supply) {
    std::lock_guard<std::mutex> lock(mutex_);
    totalSupply_ = supply;
}

// ============================================================================
// MemoryPriceFeed
// ============================================================================

MemoryPriceFeed::MemoryPriceFeed(std::string description, uint8_t decimals,
                                 const Int256& answer)
    : description_(std::move(description)), decimals_(decimals) {
    round_.roundId = 1;
    round_.answeredInRound = 1;
    round_.answer = answer;
}

uint8_t MemoryPriceFeed::Decimals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return decimals_;
}

oracle::RoundData MemoryPriceFeed::LatestRoundData() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ++reads_;
    return round_;
}

std::string MemoryPriceFeed::Description() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return description_;
}

void MemoryPriceFeed::SetAnswer(const Int256& answer, Timestamp updatedAt) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++round_.roundId;
    round_.answeredInRound = round_.roundId;
    round_.answer = answer;
    round_.startedAt = updatedAt;
    round_.updatedAt = updatedAt;
}

uint64_t MemoryPriceFeed::ReadCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reads_;
}

// ============================================================================
// MemoryPool
// ============================================================================

MemoryPool::MemoryPool(std::string name, const Address& token0, const Address& token1)
    : name_(std::move(name)), token0_(token0), token1_(token1) {}

std::string MemoryPool::Name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return name_;
}

UInt256 MemoryPool::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSupply_;
}

oracle::Reserves MemoryPool::GetReserves() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserves_;
}

Address MemoryPool::Token0() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return token0_;
}

Address MemoryPool::Token1() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return token1_;
}

bool MemoryPool::IsLocked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locked_;
}

void MemoryPool::SetReserves(const UInt256& reserve0, const UInt256& reserve1,
                             uint32_t timestamp) {
    if (reserve0 > MaxUInt112() || reserve1 > MaxUInt112()) {
        throw std::out_of_range("reserve exceeds uint112");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    reserves_.reserve0 = reserve0;
    reserves_.reserve1 = reserve1;
    reserves_.blockTimestampLast = timestamp;
}

void MemoryPool::SetTotalSupply(const UInt256& supply) {
    std::lock_guard<std::mutex> lock(mutex_);
    totalSupply_ = supply;
}

void MemoryPool::SetLocked(bool locked) {
    std::lock_guard<std::mutex> lock(mutex_);
    locked_ = locked;
}

// ============================================================================
// MemoryChain
// ============================================================================

void MemoryChain::AddAsset(const Address& addr, std::shared_ptr<MemoryAsset> asset) {
    std::lock_guard<std::mutex> lock(mutex_);
    assets_[addr] = std::move(asset);
}

void MemoryChain::AddFeed(const Address& addr, std::shared_ptr<MemoryPriceFeed> feed) {
    std::lock_guard<std::mutex> lock(mutex_);
    feeds_[addr] = std::move(feed);
}

void MemoryChain::AddPool(const Address& addr, std::shared_ptr<MemoryPool> pool) {
    std::lock_guard<std::mutex> lock(mutex_);
    pools_[addr] = std::move(pool);
}

void MemoryChain::Remove(const Address& addr) {
    std::lock_guard<std::mutex> lock(mutex_);
    assets_.erase(addr);
    feeds_.erase(addr);
    pools_.erase(addr);
}

std::shared_ptr<const oracle::IAsset> MemoryChain::GetAsset(const Address& addr) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = assets_.find(addr);
    if (it != assets_.end()) {
        return it->second;
    }
    auto poolIt = pools_.find(addr);
    if (poolIt != pools_.end()) {
        return poolIt->second;
    }
    return nullptr;
}

std::shared_ptr<const oracle::IPriceFeed> MemoryChain::GetFeed(const Address& addr) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = feeds_.find(addr);
    if (it == feeds_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<const oracle::IPool> MemoryChain::GetPool(const Address& addr) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(addr);
    if (it == pools_.end()) {
        return nullptr;
    }
    return it->second;
}

} // namespace chain
} // namespace nebula
