// NEBULA - Oracle Registry
// Copyright (c) 2024 NEBULA Developers
// MIT License
//
// Directory of oracle instances ("nebulas") and of the liquidity tokens each
// one prices. The registry is the registrar of every instance it holds:
// liquidity tokens are registered through it, and price queries are
// dispatched by it to the owning instance.

#ifndef NEBULA_ORACLE_REGISTRY_H
#define NEBULA_ORACLE_REGISTRY_H

#include <nebula/core/types.h>
#include <nebula/oracle/admin.h>
#include <nebula/oracle/nebula_oracle.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nebula {
namespace oracle {

// ============================================================================
// Nebula Descriptor
// ============================================================================

/// Registry entry of one oracle instance
struct NebulaDescriptor {
    /// Instance name at creation
    std::string name;

    Address instanceAddress;

    /// Creation order
    uint64_t nebulaId{0};

    /// Liquidity tokens registered through the registry
    uint64_t totalOraclesRegistered{0};

    Timestamp createdAt{0};

    std::string ToString() const;
};

// ============================================================================
// Oracle Registry
// ============================================================================

class OracleRegistry {
public:
    using NebulaCallback = std::function<void(const NebulaDescriptor&)>;
    using IndexCallback = std::function<void(uint64_t nebulaId, const Address& lpToken)>;

    /**
     * @param selfAddress Address of the registry; instances should name it
     *        as their registrar
     * @param admin Initial registry admin
     */
    OracleRegistry(const Address& selfAddress, const Address& admin);
    ~OracleRegistry();

    OracleRegistry(const OracleRegistry&) = delete;
    OracleRegistry& operator=(const OracleRegistry&) = delete;

    const Address& SelfAddress() const { return selfAddress_; }

    // ========================================================================
    // Instances
    // ========================================================================

    /**
     * Add an oracle instance under the next nebula id.
     *
     * @throws OracleError MsgSenderNotAdmin, OracleAlreadyAdded when an
     *         instance with the same address is already present
     * @throws std::invalid_argument on a null instance
     * @return The new nebula id
     */
    uint64_t CreateOracleInstance(const Address& caller, std::shared_ptr<INebulaOracle> instance);

    /**
     * Register a liquidity token in instance `nebulaId` and index it.
     *
     * @throws OracleError MsgSenderNotAdmin, NebulaNotFound, and whatever the
     *         instance rejects the registration with
     */
    void RegisterLiquidityToken(const Address& caller, uint64_t nebulaId,
                                const Address& lpToken, const std::vector<Address>& feeds);

    // ========================================================================
    // Pricing
    // ========================================================================

    /**
     * Fair price of `lpToken` from its owning instance.
     *
     * @throws OracleError PairNotInitialized when the token is not indexed,
     *         PriceCantBeZero on a zero price, and any instance error
     */
    UInt256 PriceOf(const Address& lpToken) const;

    std::vector<UInt256> AssetPrices(const Address& lpToken) const;

    /// Denomination price of the instance that owns `lpToken`
    UInt256 DenominationPrice(const Address& lpToken) const;

    // ========================================================================
    // Lookup
    // ========================================================================

    std::optional<NebulaDescriptor> GetNebula(uint64_t nebulaId) const;
    std::optional<NebulaDescriptor> GetNebulaByAddress(const Address& instance) const;

    /// Instance behind `nebulaId` (null if unknown)
    std::shared_ptr<INebulaOracle> GetInstance(uint64_t nebulaId) const;

    /// Address of the instance owning `lpToken` (null if unregistered)
    Address NebulaFor(const Address& lpToken) const;

    size_t TotalNebulas() const;
    std::vector<NebulaDescriptor> AllNebulas() const;

    size_t TotalLiquidityTokens() const;
    std::vector<Address> AllLiquidityTokens() const;

    // ========================================================================
    // Admin
    // ========================================================================

    Address Admin() const;
    Address PendingAdmin() const;

    void ProposeAdmin(const Address& caller, const Address& candidate);
    void AcceptAdmin(const Address& caller);

    // ========================================================================
    // Events
    // ========================================================================

    void OnNebulaCreated(NebulaCallback callback);
    void OnLiquidityTokenIndexed(IndexCallback callback);
    void OnNewPendingAdmin(AdminControl::ChangeCallback callback);
    void OnNewAdmin(AdminControl::ChangeCallback callback);

private:
    /// Owning instance of `lpToken`; caller holds mutex_
    std::shared_ptr<INebulaOracle> InstanceFor(const Address& lpToken, const char* action) const;

    const Address selfAddress_;
    AdminControl admin_;

    /// Indexed by nebula id
    std::vector<NebulaDescriptor> nebulas_;
    std::vector<std::shared_ptr<INebulaOracle>> instances_;

    /// Instance address -> nebula id
    std::map<Address, uint64_t> byAddress_;

    /// Liquidity token -> nebula id
    std::map<Address, uint64_t> lpIndex_;
    std::vector<Address> liquidityTokens_;

    std::vector<NebulaCallback> createdCallbacks_;
    std::vector<IndexCallback> indexedCallbacks_;
    std::vector<AdminControl::ChangeCallback> pendingAdminCallbacks_;
    std::vector<AdminControl::ChangeCallback> adminCallbacks_;

    mutable std::mutex mutex_;
};

} // namespace oracle
} // namespace nebula

#endif // NEBULA_ORACLE_REGISTRY_H
