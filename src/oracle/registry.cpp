// NEBULA - Oracle Registry Implementation
// Copyright (c) 2024 NEBULA Developers
// MIT License

#include "nebula/oracle/registry.h"
#include "nebula/core/errors.h"
#include "nebula/util/logging.h"
#include "nebula/util/time.h"

#include <sstream>
#include <stdexcept>

namespace nebula {
namespace oracle {

namespace {
const char* const CATEGORY = util::LogCategory::REGISTRY;
}

// ============================================================================
// NebulaDescriptor
// ============================================================================

std::string NebulaDescriptor::ToString() const {
    std::ostringstream ss;
    ss << "Nebula(id=" << nebulaId
       << ", name=" << name
       << ", address=" << instanceAddress.ToShortHex()
       << ", oracles=" << totalOraclesRegistered
       << ", created=" << util::FormatISO8601(createdAt)
       << ")";
    return ss.str();
}

// ============================================================================
// OracleRegistry
// ============================================================================

OracleRegistry::OracleRegistry(const Address& selfAddress, const Address& admin)
    : selfAddress_(selfAddress), admin_(admin) {
    LOG_INFO(CATEGORY) << "Registry at " << selfAddress_.ToHex()
                       << " administered by " << admin.ToHex();
}

OracleRegistry::~OracleRegistry() = default;

uint64_t OracleRegistry::CreateOracleInstance(const Address& caller,
                                              std::shared_ptr<INebulaOracle> instance) {
    if (!instance) {
        throw std::invalid_argument("null oracle instance");
    }

    NebulaDescriptor descriptor;
    std::vector<NebulaCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        admin_.RequireAdmin(caller, CATEGORY, "createOracleInstance");

        Address instanceAddress = instance->SelfAddress();
        for (const auto& existing : nebulas_) {
            if (existing.instanceAddress == instanceAddress) {
                LOG_WARN(CATEGORY) << "createOracleInstance: " << instanceAddress.ToHex()
                                   << " already added as nebula " << existing.nebulaId;
                throw OracleError(OracleErrc::OracleAlreadyAdded, instanceAddress.ToHex());
            }
        }

        descriptor.name = instance->Name();
        descriptor.instanceAddress = instanceAddress;
        descriptor.nebulaId = nebulas_.size();
        descriptor.createdAt = util::GetTime();

        nebulas_.push_back(descriptor);
        instances_.push_back(std::move(instance));
        byAddress_[instanceAddress] = descriptor.nebulaId;

        LOG_INFO(CATEGORY) << "Created " << descriptor.ToString();
        callbacks = createdCallbacks_;
    }

    for (const auto& callback : callbacks) {
        callback(descriptor);
    }
    return descriptor.nebulaId;
}

void OracleRegistry::RegisterLiquidityToken(const Address& caller, uint64_t nebulaId,
                                            const Address& lpToken,
                                            const std::vector<Address>& feeds) {
    std::shared_ptr<INebulaOracle> instance;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        admin_.RequireAdmin(caller, CATEGORY, "registerLiquidityToken");

        if (nebulaId >= nebulas_.size()) {
            LOG_WARN(CATEGORY) << "registerLiquidityToken: no nebula " << nebulaId;
            throw OracleError(OracleErrc::NebulaNotFound, std::to_string(nebulaId));
        }
        instance = instances_[nebulaId];
    }

    // Unlocked: the instance fires its own subscribers, which may query us.
    // Throws before any registry state changes.
    instance->RegisterLiquidityToken(selfAddress_, lpToken, feeds);

    std::vector<IndexCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        NebulaDescriptor& descriptor = nebulas_[nebulaId];
        ++descriptor.totalOraclesRegistered;
        lpIndex_[lpToken] = nebulaId;
        liquidityTokens_.push_back(lpToken);

        LOG_INFO(CATEGORY) << "Indexed " << lpToken.ToHex() << " under nebula " << nebulaId
                           << " (" << descriptor.totalOraclesRegistered << " registered)";
        callbacks = indexedCallbacks_;
    }

    for (const auto& callback : callbacks) {
        callback(nebulaId, lpToken);
    }
}

// ============================================================================
// Pricing
// ============================================================================

std::shared_ptr<INebulaOracle> OracleRegistry::InstanceFor(const Address& lpToken,
                                                           const char* action) const {
    auto it = lpIndex_.find(lpToken);
    if (it == lpIndex_.end()) {
        LOG_WARN(CATEGORY) << action << ": " << lpToken.ToHex() << " is not indexed";
        throw OracleError(OracleErrc::PairNotInitialized, lpToken.ToHex());
    }
    return instances_[it->second];
}

UInt256 OracleRegistry::PriceOf(const Address& lpToken) const {
    std::shared_ptr<INebulaOracle> instance;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        instance = InstanceFor(lpToken, "priceOf");
    }

    UInt256 price = instance->PriceOf(lpToken);
    if (price == 0) {
        LOG_ERROR(CATEGORY) << "priceOf: " << instance->Name() << " priced "
                            << lpToken.ToHex() << " at zero";
        throw OracleError(OracleErrc::PriceCantBeZero, lpToken.ToHex());
    }
    return price;
}

std::vector<UInt256> OracleRegistry::AssetPrices(const Address& lpToken) const {
    std::shared_ptr<INebulaOracle> instance;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        instance = InstanceFor(lpToken, "assetPrices");
    }
    return instance->AssetPrices(lpToken);
}

UInt256 OracleRegistry::DenominationPrice(const Address& lpToken) const {
    std::shared_ptr<INebulaOracle> instance;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        instance = InstanceFor(lpToken, "denominationPrice");
    }
    return instance->DenominationPrice();
}

// ============================================================================
// Lookup
// ============================================================================

std::optional<NebulaDescriptor> OracleRegistry::GetNebula(uint64_t nebulaId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (nebulaId >= nebulas_.size()) {
        return std::nullopt;
    }
    return nebulas_[nebulaId];
}

std::optional<NebulaDescriptor> OracleRegistry::GetNebulaByAddress(const Address& instance) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = byAddress_.find(instance);
    if (it == byAddress_.end()) {
        return std::nullopt;
    }
    return nebulas_[it->second];
}

std::shared_ptr<INebulaOracle> OracleRegistry::GetInstance(uint64_t nebulaId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (nebulaId >= instances_.size()) {
        return nullptr;
    }
    return instances_[nebulaId];
}

Address OracleRegistry::NebulaFor(const Address& lpToken) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lpIndex_.find(lpToken);
    if (it == lpIndex_.end()) {
        return Address();
    }
    return nebulas_[it->second].instanceAddress;
}

size_t OracleRegistry::TotalNebulas() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nebulas_.size();
}

std::vector<NebulaDescriptor> OracleRegistry::AllNebulas() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nebulas_;
}

size_t OracleRegistry::TotalLiquidityTokens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return liquidityTokens_.size();
}

std::vector<Address> OracleRegistry::AllLiquidityTokens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return liquidityTokens_;
}

// ============================================================================
// Admin
// ============================================================================

Address OracleRegistry::Admin() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return admin_.Admin();
}

Address OracleRegistry::PendingAdmin() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return admin_.PendingAdmin();
}

void OracleRegistry::ProposeAdmin(const Address& caller, const Address& candidate) {
    Address previous;
    std::vector<AdminControl::ChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = admin_.ProposeAdmin(caller, candidate, CATEGORY);
        callbacks = pendingAdminCallbacks_;
    }

    for (const auto& callback : callbacks) {
        callback(previous, candidate);
    }
}

void OracleRegistry::AcceptAdmin(const Address& caller) {
    Address previous;
    Address current;
    std::vector<AdminControl::ChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = admin_.AcceptAdmin(caller, CATEGORY);
        current = admin_.Admin();
        callbacks = adminCallbacks_;
    }

    for (const auto& callback : callbacks) {
        callback(previous, current);
    }
}

// ============================================================================
// Events
// ============================================================================

void OracleRegistry::OnNebulaCreated(NebulaCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    createdCallbacks_.push_back(std::move(callback));
}

void OracleRegistry::OnLiquidityTokenIndexed(IndexCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    indexedCallbacks_.push_back(std::move(callback));
}

void OracleRegistry::OnNewPendingAdmin(AdminControl::ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    pendingAdminCallbacks_.push_back(std::move(callback));
}

void OracleRegistry::OnNewAdmin(AdminControl::ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    adminCallbacks_.push_back(std::move(callback));
}

} // namespace oracle
} // namespace nebula
