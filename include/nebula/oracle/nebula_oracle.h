// NEBULA - Fair LP Token Oracle
// Copyright (c) 2024 NEBULA Developers
// MIT License
//
// Prices constant-product liquidity tokens from external feeds instead of
// the pool's own spot ratio:
//
//   price = 2 * sqrt(r0 * r1) * sqrt(p0 * p1) / totalSupply
//
// expressed in a denomination asset. Because the reserves only enter through
// their product, moving them along the pool's invariant inside a single
// transaction does not move the price.

#ifndef NEBULA_ORACLE_NEBULA_ORACLE_H
#define NEBULA_ORACLE_NEBULA_ORACLE_H

#include <nebula/core/types.h>
#include <nebula/oracle/admin.h>
#include <nebula/oracle/decimals.h>
#include <nebula/oracle/feed_reader.h>
#include <nebula/oracle/interfaces.h>
#include <nebula/oracle/settings.h>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace nebula {
namespace oracle {

// ============================================================================
// Oracle Record
// ============================================================================

/**
 * Registration of one liquidity token.
 *
 * The four lists are parallel: poolTokens[i] is priced by priceFeeds[i].
 * A default-constructed record is the uninitialized (or removed) state.
 */
struct OracleRecord {
    /// Guards every price read
    bool initialized{false};

    /// Registration order, never reused
    uint64_t oracleId{0};

    /// Name of the liquidity token at registration
    std::string name;

    /// The liquidity token itself
    Address underlying;

    std::vector<Address> poolTokens;
    std::vector<uint8_t> poolTokenDecimals;
    std::vector<Address> priceFeeds;
    std::vector<uint8_t> priceFeedDecimals;

    bool operator==(const OracleRecord& other) const;
    bool operator!=(const OracleRecord& other) const { return !(*this == other); }

    std::string ToString() const;
};

// ============================================================================
// Oracle Interface
// ============================================================================

/**
 * What the registry needs from an oracle instance. Every pricing algorithm
 * sits behind this interface.
 */
class INebulaOracle {
public:
    virtual ~INebulaOracle() = default;

    virtual std::string Name() const = 0;
    virtual Address SelfAddress() const = 0;

    /// Output decimals of every price
    virtual uint8_t Decimals() const = 0;

    virtual void RegisterLiquidityToken(const Address& caller, const Address& lpToken,
                                        const std::vector<Address>& feeds) = 0;

    virtual UInt256 PriceOf(const Address& lpToken) const = 0;
    virtual std::vector<UInt256> AssetPrices(const Address& lpToken) const = 0;
    virtual UInt256 DenominationPrice() const = 0;

    virtual OracleRecord GetRecord(const Address& lpToken) const = 0;
};

// ============================================================================
// Nebula Oracle
// ============================================================================

/**
 * Oracle for a family of two-asset constant-product liquidity tokens.
 *
 * Registration is open to the registrar (normally the owning registry) and
 * to the admin; removal and admin transfer to the admin only. Every mutating
 * call takes the caller explicitly and either succeeds completely or throws
 * OracleError without touching state.
 */
class NebulaOracle : public INebulaOracle {
public:
    using RecordCallback = std::function<void(const OracleRecord&)>;

    /**
     * @param chain Host ledger; must outlive the oracle
     * @param selfAddress Address this oracle is deployed at
     * @param registrar Caller allowed to register tokens besides the admin
     * @param admin Initial admin
     * @param settings Denomination asset and feed, name, context guard
     * @throws OracleError UnknownContract if the denomination token or feed
     *         does not exist, DecimalsZero/DecimalsTooLarge if either has
     *         unusable decimals
     */
    NebulaOracle(const IChainView& chain, const Address& selfAddress,
                 const Address& registrar, const Address& admin,
                 const OracleSettings& settings);
    ~NebulaOracle() override;

    NebulaOracle(const NebulaOracle&) = delete;
    NebulaOracle& operator=(const NebulaOracle&) = delete;

    // ========================================================================
    // Identity
    // ========================================================================

    std::string Name() const override { return settings_.name; }
    Address SelfAddress() const override { return selfAddress_; }
    uint8_t Decimals() const override { return decimals_; }

    const Address& DenominationToken() const { return settings_.denominationToken; }
    const Address& DenominationFeed() const { return settings_.denominationFeed; }
    const Address& Registrar() const { return registrar_; }
    bool ContextGuardEnabled() const { return settings_.contextGuard; }

    // ========================================================================
    // Registration
    // ========================================================================

    /**
     * Register a liquidity token with one feed per pool token, in pool
     * token order.
     *
     * Reads token0/token1 from the pool, validates and caches the decimal
     * scalars of both tokens and both feeds, and stores the record under
     * the next oracle id.
     *
     * @throws OracleError MsgSenderNotRegistrar, PairAlreadyInitialized,
     *         UnknownContract, InvalidFeedCount, DecimalsZero,
     *         DecimalsTooLarge
     */
    void RegisterLiquidityToken(const Address& caller, const Address& lpToken,
                                const std::vector<Address>& feeds) override;

    /**
     * Clear a registration. Its id is retired; registering the token again
     * assigns a fresh one.
     *
     * @throws OracleError MsgSenderNotAdmin, PairNotInitialized
     */
    void RemoveLiquidityToken(const Address& caller, const Address& lpToken);

    // ========================================================================
    // Pricing
    // ========================================================================

    /**
     * Fair price of one liquidity token in the denomination asset, with
     * Decimals() decimals.
     *
     * @throws OracleError PairNotInitialized, AlreadyInContext while the
     *         pool is locked, InvalidFeedValue, DivisionByZero on a zero
     *         supply or denomination price, ArithmeticOverflow
     */
    UInt256 PriceOf(const Address& lpToken) const override;

    /// Price of each pool token in the denomination asset, in pool token order
    std::vector<UInt256> AssetPrices(const Address& lpToken) const override;

    /// Denomination feed price in 18 decimals
    UInt256 DenominationPrice() const override;

    // ========================================================================
    // Records
    // ========================================================================

    /// Snapshot of the record (uninitialized default when absent)
    OracleRecord GetRecord(const Address& lpToken) const override;

    bool IsRegistered(const Address& lpToken) const;

    /// Number of ids handed out so far
    uint64_t TotalRegistered() const;

    /// Registered tokens by id; removed slots hold the null address
    std::vector<Address> AllRegistered() const;

    /// Token registered under `oracleId` (null if removed)
    /// @throws std::out_of_range past TotalRegistered()
    Address RegisteredAt(uint64_t oracleId) const;

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

    void OnLiquidityTokenRegistered(RecordCallback callback);
    void OnLiquidityTokenRemoved(RecordCallback callback);
    void OnNewPendingAdmin(AdminControl::ChangeCallback callback);
    void OnNewAdmin(AdminControl::ChangeCallback callback);

private:
    const OracleRecord& RequireRecord(const Address& lpToken, const char* action) const;

    /// Rescale an 18-decimal denomination amount to Decimals()
    UInt256 ToOutputDecimals(const UInt256& amount18) const;

    const IChainView& chain_;
    const Address selfAddress_;
    const Address registrar_;
    const OracleSettings settings_;
    uint8_t decimals_{0};

    DecimalNormalizer normalizer_;
    PriceFeedReader feedReader_;
    AdminControl admin_;

    std::map<Address, OracleRecord> records_;
    std::vector<Address> registered_;

    std::vector<RecordCallback> registeredCallbacks_;
    std::vector<RecordCallback> removedCallbacks_;
    std::vector<AdminControl::ChangeCallback> pendingAdminCallbacks_;
    std::vector<AdminControl::ChangeCallback> adminCallbacks_;

    mutable std::mutex mutex_;
};

} // namespace oracle
} // namespace nebula

#endif // NEBULA_ORACLE_NEBULA_ORACLE_H
