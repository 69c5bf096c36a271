// NEBULA - Fair LP Token Oracle Implementation
// Copyright (c) 2024 NEBULA Developers
// MIT License

#include "nebula/oracle/nebula_oracle.h"
#include "nebula/core/errors.h"
#include "nebula/math/fixed_point.h"
#include "nebula/util/logging.h"

#include <sstream>
#include <stdexcept>

namespace nebula {
namespace oracle {

namespace {

const char* const CATEGORY = util::LogCategory::ORACLE;

std::string JoinShortHex(const std::vector<Address>& addrs) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < addrs.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << addrs[i].ToShortHex();
    }
    ss << "]";
    return ss.str();
}

/// Scalar for a registration input, logging the contract that reports bad decimals
UInt256 RegistrationScalar(const Address& addr, uint8_t decimals, const char* kind) {
    try {
        return DecimalNormalizer::ScalarFor(decimals);
    } catch (const OracleError& e) {
        LOG_WARN(CATEGORY) << "register: " << kind << " " << addr.ToHex() << " reports "
                           << static_cast<int>(decimals) << " decimals ("
                           << OracleErrcToString(e.code()) << ")";
        throw;
    }
}

} // namespace

// ============================================================================
// OracleRecord
// ============================================================================

bool OracleRecord::operator==(const OracleRecord& other) const {
    return initialized == other.initialized &&
           oracleId == other.oracleId &&
           name == other.name &&
           underlying == other.underlying &&
           poolTokens == other.poolTokens &&
           poolTokenDecimals == other.poolTokenDecimals &&
           priceFeeds == other.priceFeeds &&
           priceFeedDecimals == other.priceFeedDecimals;
}

std::string OracleRecord::ToString() const {
    std::ostringstream ss;
    ss << "OracleRecord(id=" << oracleId
       << ", name=" << name
       << ", lp=" << underlying.ToShortHex()
       << ", tokens=" << JoinShortHex(poolTokens)
       << ", feeds=" << JoinShortHex(priceFeeds)
       << (initialized ? "" : ", uninitialized")
       << ")";
    return ss.str();
}

// ============================================================================
// NebulaOracle
// ============================================================================

NebulaOracle::NebulaOracle(const IChainView& chain, const Address& selfAddress,
                           const Address& registrar, const Address& admin,
                           const OracleSettings& settings)
    : chain_(chain)
    , selfAddress_(selfAddress)
    , registrar_(registrar)
    , settings_(settings)
    , feedReader_(chain, normalizer_)
    , admin_(admin) {
    auto token = chain_.GetAsset(settings_.denominationToken);
    if (!token) {
        LOG_ERROR(CATEGORY) << "Denomination token " << settings_.denominationToken.ToHex()
                            << " does not exist";
        throw OracleError(OracleErrc::UnknownContract, settings_.denominationToken.ToHex());
    }
    decimals_ = token->Decimals();
    // Prices are rescaled from 18 decimals down to the denomination's
    try {
        DecimalNormalizer::ScalarFor(decimals_);
    } catch (const OracleError&) {
        LOG_ERROR(CATEGORY) << "Denomination token " << settings_.denominationToken.ToHex()
                            << " reports " << static_cast<int>(decimals_) << " decimals";
        throw;
    }

    auto feed = chain_.GetFeed(settings_.denominationFeed);
    if (!feed) {
        LOG_ERROR(CATEGORY) << "Denomination feed " << settings_.denominationFeed.ToHex()
                            << " does not exist";
        throw OracleError(OracleErrc::UnknownContract, settings_.denominationFeed.ToHex());
    }
    normalizer_.ComputeScalar(settings_.denominationFeed, *feed);

    LOG_INFO(CATEGORY) << "Oracle '" << settings_.name << "' at " << selfAddress_.ToHex()
                       << " denominated in " << token->Name()
                       << " (" << static_cast<int>(decimals_) << " decimals)"
                       << (settings_.contextGuard ? "" : ", context guard off");
}

NebulaOracle::~NebulaOracle() = default;

// ============================================================================
// Registration
// ============================================================================

void NebulaOracle::RegisterLiquidityToken(const Address& caller, const Address& lpToken,
                                          const std::vector<Address>& feeds) {
    OracleRecord snapshot;
    std::vector<RecordCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (caller != registrar_ && !admin_.IsAdmin(caller)) {
            LOG_WARN(CATEGORY) << "register: " << caller.ToShortHex() << " is not registrar";
            throw OracleError(OracleErrc::MsgSenderNotRegistrar, caller.ToHex());
        }

        auto existing = records_.find(lpToken);
        if (existing != records_.end() && existing->second.initialized) {
            LOG_WARN(CATEGORY) << "register: " << lpToken.ToHex() << " already registered as id "
                               << existing->second.oracleId;
            throw OracleError(OracleErrc::PairAlreadyInitialized, lpToken.ToHex());
        }

        auto pool = chain_.GetPool(lpToken);
        if (!pool) {
            LOG_WARN(CATEGORY) << "register: no pool at " << lpToken.ToHex();
            throw OracleError(OracleErrc::UnknownContract, lpToken.ToHex());
        }

        OracleRecord record;
        record.poolTokens = {pool->Token0(), pool->Token1()};

        if (feeds.size() != record.poolTokens.size()) {
            LOG_WARN(CATEGORY) << "register: " << feeds.size() << " feeds for "
                               << record.poolTokens.size() << " pool tokens";
            throw OracleError(OracleErrc::InvalidFeedCount, std::to_string(feeds.size()));
        }

        // Validate every scalar before caching any of them
        std::vector<std::pair<Address, UInt256>> scalars;
        for (const auto& tokenAddr : record.poolTokens) {
            auto token = chain_.GetAsset(tokenAddr);
            if (!token) {
                LOG_WARN(CATEGORY) << "register: no asset at " << tokenAddr.ToHex();
                throw OracleError(OracleErrc::UnknownContract, tokenAddr.ToHex());
            }
            uint8_t decimals = token->Decimals();
            scalars.emplace_back(tokenAddr, RegistrationScalar(tokenAddr, decimals, "token"));
            record.poolTokenDecimals.push_back(decimals);
        }
        for (const auto& feedAddr : feeds) {
            auto feed = chain_.GetFeed(feedAddr);
            if (!feed) {
                LOG_WARN(CATEGORY) << "register: no price feed at " << feedAddr.ToHex();
                throw OracleError(OracleErrc::UnknownContract, feedAddr.ToHex());
            }
            uint8_t decimals = feed->Decimals();
            scalars.emplace_back(feedAddr, RegistrationScalar(feedAddr, decimals, "price feed"));
            record.priceFeedDecimals.push_back(decimals);
        }

        record.initialized = true;
        record.oracleId = registered_.size();
        record.name = pool->Name();
        record.underlying = lpToken;
        record.priceFeeds = feeds;

        for (const auto& [addr, scalar] : scalars) {
            normalizer_.Store(addr, scalar);
        }
        registered_.push_back(lpToken);
        records_[lpToken] = record;

        LOG_INFO(CATEGORY) << "Registered " << record.ToString();
        snapshot = record;
        callbacks = registeredCallbacks_;
    }

    for (const auto& callback : callbacks) {
        callback(snapshot);
    }
}

void NebulaOracle::RemoveLiquidityToken(const Address& caller, const Address& lpToken) {
    OracleRecord removed;
    std::vector<RecordCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        admin_.RequireAdmin(caller, CATEGORY, "remove");

        removed = RequireRecord(lpToken, "remove");
        records_.erase(lpToken);
        registered_[removed.oracleId] = Address();

        LOG_INFO(CATEGORY) << "Removed " << removed.ToString();
        callbacks = removedCallbacks_;
    }

    for (const auto& callback : callbacks) {
        callback(removed);
    }
}

const OracleRecord& NebulaOracle::RequireRecord(const Address& lpToken,
                                                const char* action) const {
    auto it = records_.find(lpToken);
    if (it == records_.end() || !it->second.initialized) {
        LOG_WARN(CATEGORY) << action << ": " << lpToken.ToHex() << " not registered";
        throw OracleError(OracleErrc::PairNotInitialized, lpToken.ToHex());
    }
    return it->second;
}

// ============================================================================
// Pricing
// ============================================================================

UInt256 NebulaOracle::ToOutputDecimals(const UInt256& amount18) const {
    return amount18 / math::Pow10(math::FIXED_DECIMALS - decimals_);
}

UInt256 NebulaOracle::DenominationPrice() const {
    return feedReader_.LatestPrice(settings_.denominationFeed);
}

UInt256 NebulaOracle::PriceOf(const Address& lpToken) const {
    OracleRecord record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record = RequireRecord(lpToken, "priceOf");
    }

    auto pool = chain_.GetPool(lpToken);
    if (!pool) {
        LOG_ERROR(CATEGORY) << "priceOf: pool " << lpToken.ToHex() << " vanished";
        throw OracleError(OracleErrc::UnknownContract, lpToken.ToHex());
    }

    if (settings_.contextGuard && pool->IsLocked()) {
        LOG_WARN(CATEGORY) << "priceOf: pool " << lpToken.ToHex() << " is mid-operation";
        throw OracleError(OracleErrc::AlreadyInContext, lpToken.ToHex());
    }

    // 1-2. Geometric mean of the normalized reserves
    Reserves reserves = pool->GetReserves();
    UInt256 reserve0 = normalizer_.Normalize(record.poolTokens[0], reserves.reserve0);
    UInt256 reserve1 = normalizer_.Normalize(record.poolTokens[1], reserves.reserve1);
    UInt256 reserveProduct = math::GeometricMean(reserve0, reserve1);

    // 3-4. Geometric mean of the normalized feed prices
    UInt256 price0 = feedReader_.LatestPrice(record.priceFeeds[0]);
    UInt256 price1 = feedReader_.LatestPrice(record.priceFeeds[1]);
    UInt256 priceProduct = math::GeometricMean(price0, price1);

    // 5-6. Fair value of one LP unit
    UInt256 totalSupply = pool->TotalSupply();
    if (totalSupply == 0) {
        LOG_ERROR(CATEGORY) << "priceOf: " << lpToken.ToHex() << " has zero supply";
        throw OracleError(OracleErrc::DivisionByZero, "totalSupply");
    }
    UInt256 fairValue = math::MulDiv(reserveProduct, priceProduct, totalSupply);
    if (fairValue > MaxUInt256() / 2) {
        LOG_ERROR(CATEGORY) << "priceOf: fair value of " << lpToken.ToHex() << " overflows";
        throw OracleError(OracleErrc::ArithmeticOverflow, "priceOf");
    }
    UInt256 rawPrice = fairValue * 2;

    // 7. Express in the denomination asset
    UInt256 denominationPrice = DenominationPrice();
    UInt256 price = ToOutputDecimals(math::Div(rawPrice, denominationPrice));

    LOG_DEBUG(CATEGORY) << "priceOf " << record.name << ": reserves " << reserveProduct
                        << " prices " << priceProduct << " supply " << totalSupply
                        << " -> " << math::ToDecimalString(price, decimals_);
    return price;
}

std::vector<UInt256> NebulaOracle::AssetPrices(const Address& lpToken) const {
    OracleRecord record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record = RequireRecord(lpToken, "assetPrices");
    }

    UInt256 denominationPrice = DenominationPrice();

    std::vector<UInt256> prices;
    prices.reserve(record.priceFeeds.size());
    for (const auto& feed : record.priceFeeds) {
        UInt256 price = feedReader_.LatestPrice(feed);
        prices.push_back(ToOutputDecimals(math::Div(price, denominationPrice)));
    }
    return prices;
}

// ============================================================================
// Records
// ============================================================================

OracleRecord NebulaOracle::GetRecord(const Address& lpToken) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(lpToken);
    if (it == records_.end()) {
        return OracleRecord();
    }
    return it->second;
}

bool NebulaOracle::IsRegistered(const Address& lpToken) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(lpToken);
    return it != records_.end() && it->second.initialized;
}

uint64_t NebulaOracle::TotalRegistered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registered_.size();
}

std::vector<Address> NebulaOracle::AllRegistered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registered_;
}

Address NebulaOracle::RegisteredAt(uint64_t oracleId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (oracleId >= registered_.size()) {
        throw std::out_of_range("oracle id " + std::to_string(oracleId));
    }
    return registered_[oracleId];
}

// ============================================================================
// Admin
// ============================================================================

Address NebulaOracle::Admin() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return admin_.Admin();
}

Address NebulaOracle::PendingAdmin() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return admin_.PendingAdmin();
}

void NebulaOracle::ProposeAdmin(const Address& caller, const Address& candidate) {
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

void NebulaOracle::AcceptAdmin(const Address& caller) {
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

void NebulaOracle::OnLiquidityTokenRegistered(RecordCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    registeredCallbacks_.push_back(std::move(callback));
}

void NebulaOracle::OnLiquidityTokenRemoved(RecordCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    removedCallbacks_.push_back(std::move(callback));
}

void NebulaOracle::OnNewPendingAdmin(AdminControl::ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    pendingAdminCallbacks_.push_back(std::move(callback));
}

void NebulaOracle::OnNewAdmin(AdminControl::ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    adminCallbacks_.push_back(std::move(callback));
}

} // namespace oracle
} // namespace nebula
