// NEBULA - Fair LP Token Oracle Tests
// Copyright (c) 2024 NEBULA Developers
// MIT License

#include <gtest/gtest.h>
#include "nebula/chain/memory_chain.h"
#include "nebula/core/errors.h"
#include "nebula/math/fixed_point.h"
#include "nebula/oracle/nebula_oracle.h"
#include "nebula/util/logging.h"

#include <memory>
#include <vector>

namespace nebula {
namespace oracle {
namespace {

/// n * 10^decimals
UInt256 Units(uint64_t n, unsigned decimals = 18) {
    return UInt256(n) * math::Pow10(decimals);
}

// ============================================================================
// Test Fixture
// ============================================================================

/**
 * A DAI-denominated oracle over a WAVAX/USDC-style pool:
 * - token0 has 18 decimals, token1 has 6
 * - feed0 reports 2.00 with 8 decimals, feed1 reports 0.50 with 18
 * - reserves 1000 and 4000, supply 100, DAI at 1.00
 */
class NebulaOracleTest : public ::testing::Test {
protected:
    chain::MemoryChain chain_;

    Address self_ = Address::FromSeed(0x0AC1E);
    Address registrar_ = Address::FromSeed(0x2E61);
    Address admin_ = Address::FromSeed(0xAD);
    Address outsider_ = Address::FromSeed(0xBAD);

    Address daiAddr_ = Address::FromSeed(0xDA1);
    Address daiFeedAddr_ = Address::FromSeed(0xDA1F);
    Address token0Addr_ = Address::FromSeed(0x70);
    Address token1Addr_ = Address::FromSeed(0x71);
    Address feed0Addr_ = Address::FromSeed(0xF0);
    Address feed1Addr_ = Address::FromSeed(0xF1);
    Address lpAddr_ = Address::FromSeed(0x1B);

    std::shared_ptr<chain::MemoryAsset> dai_;
    std::shared_ptr<chain::MemoryPriceFeed> daiFeed_;
    std::shared_ptr<chain::MemoryPriceFeed> feed0_;
    std::shared_ptr<chain::MemoryPriceFeed> feed1_;
    std::shared_ptr<chain::MemoryPool> pool_;

    OracleSettings settings_;
    std::unique_ptr<NebulaOracle> oracle_;

    void SetUp() override {
        dai_ = std::make_shared<chain::MemoryAsset>("Dai Stablecoin", 18);
        daiFeed_ = std::make_shared<chain::MemoryPriceFeed>("DAI / USD", 8, 100000000);
        chain_.AddAsset(daiAddr_, dai_);
        chain_.AddFeed(daiFeedAddr_, daiFeed_);

        chain_.AddAsset(token0Addr_, std::make_shared<chain::MemoryAsset>("Wrapped AVAX", 18));
        chain_.AddAsset(token1Addr_, std::make_shared<chain::MemoryAsset>("USD Coin", 6));

        feed0_ = std::make_shared<chain::MemoryPriceFeed>("AVAX / USD", 8, 200000000);
        feed1_ = std::make_shared<chain::MemoryPriceFeed>("USDC / USD", 18,
                                                          Int256(Units(5, 17)));
        chain_.AddFeed(feed0Addr_, feed0_);
        chain_.AddFeed(feed1Addr_, feed1_);

        pool_ = std::make_shared<chain::MemoryPool>("WAVAX/USDC LP", token0Addr_, token1Addr_);
        pool_->SetReserves(Units(1000), Units(4000, 6));
        pool_->SetTotalSupply(Units(100));
        chain_.AddPool(lpAddr_, pool_);

        settings_.name = "Nebula Constant Product";
        settings_.denominationToken = daiAddr_;
        settings_.denominationFeed = daiFeedAddr_;
        oracle_ = MakeOracle(settings_);
    }

    std::unique_ptr<NebulaOracle> MakeOracle(const OracleSettings& settings) {
        return std::make_unique<NebulaOracle>(chain_, self_, registrar_, admin_, settings);
    }

    std::vector<Address> Feeds() const {
        return {feed0Addr_, feed1Addr_};
    }

    void Register() {
        oracle_->RegisterLiquidityToken(registrar_, lpAddr_, Feeds());
    }

    /// Deploy another token0/token1 pool at `addr`
    std::shared_ptr<chain::MemoryPool> AddPool(const Address& addr) {
        auto pool = std::make_shared<chain::MemoryPool>("Second LP", token0Addr_, token1Addr_);
        pool->SetReserves(Units(10), Units(40, 6));
        pool->SetTotalSupply(Units(1));
        chain_.AddPool(addr, pool);
        return pool;
    }

    template<typename Fn>
    OracleErrc Capture(Fn&& fn) {
        try {
            fn();
        } catch (const OracleError& e) {
            return e.code();
        }
        ADD_FAILURE() << "expected OracleError";
        return OracleErrc::UnknownContract;
    }
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(NebulaOracleTest, Identity) {
    EXPECT_EQ(oracle_->Name(), "Nebula Constant Product");
    EXPECT_EQ(oracle_->SelfAddress(), self_);
    EXPECT_EQ(oracle_->Registrar(), registrar_);
    EXPECT_EQ(oracle_->Admin(), admin_);
    EXPECT_TRUE(oracle_->PendingAdmin().IsNull());
    EXPECT_EQ(oracle_->DenominationToken(), daiAddr_);
    EXPECT_EQ(oracle_->DenominationFeed(), daiFeedAddr_);
    EXPECT_EQ(oracle_->Decimals(), 18);
    EXPECT_TRUE(oracle_->ContextGuardEnabled());
    EXPECT_EQ(oracle_->TotalRegistered(), 0u);
}

TEST_F(NebulaOracleTest, DenominationPriceIsNormalized) {
    EXPECT_EQ(oracle_->DenominationPrice(), Units(1));
}

TEST_F(NebulaOracleTest, UnknownDenominationToken) {
    OracleSettings settings = settings_;
    settings.denominationToken = Address::FromSeed(0x404);
    EXPECT_EQ(Capture([&] { MakeOracle(settings); }), OracleErrc::UnknownContract);
}

TEST_F(NebulaOracleTest, UnknownDenominationFeed) {
    OracleSettings settings = settings_;
    settings.denominationFeed = Address::FromSeed(0x404);
    EXPECT_EQ(Capture([&] { MakeOracle(settings); }), OracleErrc::UnknownContract);
}

TEST_F(NebulaOracleTest, DenominationWithZeroDecimals) {
    dai_->SetDecimals(0);
    EXPECT_EQ(Capture([&] { MakeOracle(settings_); }), OracleErrc::DecimalsZero);
}

// ============================================================================
// Registration
// ============================================================================

TEST_F(NebulaOracleTest, RegisterSnapshotsRecord) {
    Register();

    OracleRecord record = oracle_->GetRecord(lpAddr_);
    EXPECT_TRUE(record.initialized);
    EXPECT_EQ(record.oracleId, 0u);
    EXPECT_EQ(record.name, "WAVAX/USDC LP");
    EXPECT_EQ(record.underlying, lpAddr_);
    EXPECT_EQ(record.poolTokens, (std::vector<Address>{token0Addr_, token1Addr_}));
    EXPECT_EQ(record.poolTokenDecimals, (std::vector<uint8_t>{18, 6}));
    EXPECT_EQ(record.priceFeeds, Feeds());
    EXPECT_EQ(record.priceFeedDecimals, (std::vector<uint8_t>{8, 18}));

    EXPECT_TRUE(oracle_->IsRegistered(lpAddr_));
    EXPECT_EQ(oracle_->TotalRegistered(), 1u);
    EXPECT_EQ(oracle_->RegisteredAt(0), lpAddr_);
}

TEST_F(NebulaOracleTest, AdminMayRegister) {
    oracle_->RegisterLiquidityToken(admin_, lpAddr_, Feeds());
    EXPECT_TRUE(oracle_->IsRegistered(lpAddr_));
}

TEST_F(NebulaOracleTest, OutsiderMayNotRegister) {
    EXPECT_EQ(Capture([&] { oracle_->RegisterLiquidityToken(outsider_, lpAddr_, Feeds()); }),
              OracleErrc::MsgSenderNotRegistrar);
    EXPECT_FALSE(oracle_->IsRegistered(lpAddr_));
}

TEST_F(NebulaOracleTest, RegisterTwiceFailsAndKeepsRecord) {
    Register();
    OracleRecord before = oracle_->GetRecord(lpAddr_);

    // Even with different feeds the first registration stands
    std::vector<Address> swapped = {feed1Addr_, feed0Addr_};
    EXPECT_EQ(Capture([&] { oracle_->RegisterLiquidityToken(registrar_, lpAddr_, swapped); }),
              OracleErrc::PairAlreadyInitialized);

    EXPECT_EQ(oracle_->GetRecord(lpAddr_), before);
    EXPECT_EQ(oracle_->TotalRegistered(), 1u);
}

TEST_F(NebulaOracleTest, WrongFeedCount) {
    std::vector<Address> one = {feed0Addr_};
    std::vector<Address> three = {feed0Addr_, feed1Addr_, daiFeedAddr_};
    EXPECT_EQ(Capture([&] { oracle_->RegisterLiquidityToken(registrar_, lpAddr_, one); }),
              OracleErrc::InvalidFeedCount);
    EXPECT_EQ(Capture([&] { oracle_->RegisterLiquidityToken(registrar_, lpAddr_, three); }),
              OracleErrc::InvalidFeedCount);
    EXPECT_EQ(oracle_->TotalRegistered(), 0u);
}

TEST_F(NebulaOracleTest, UnknownPool) {
    EXPECT_EQ(Capture([&] {
        oracle_->RegisterLiquidityToken(registrar_, Address::FromSeed(0x404), Feeds());
    }), OracleErrc::UnknownContract);
}

TEST_F(NebulaOracleTest, UnknownFeed) {
    std::vector<Address> feeds = {feed0Addr_, Address::FromSeed(0x404)};
    EXPECT_EQ(Capture([&] { oracle_->RegisterLiquidityToken(registrar_, lpAddr_, feeds); }),
              OracleErrc::UnknownContract);
    EXPECT_FALSE(oracle_->IsRegistered(lpAddr_));
}

TEST_F(NebulaOracleTest, FeedWithBadDecimalsLeavesNoTrace) {
    auto badFeed = std::make_shared<chain::MemoryPriceFeed>("BAD / USD", 19, 1);
    Address badAddr = Address::FromSeed(0xBADF);
    chain_.AddFeed(badAddr, badFeed);

    std::vector<Address> feeds = {feed0Addr_, badAddr};
    EXPECT_EQ(Capture([&] { oracle_->RegisterLiquidityToken(registrar_, lpAddr_, feeds); }),
              OracleErrc::DecimalsTooLarge);
    EXPECT_FALSE(oracle_->IsRegistered(lpAddr_));
    EXPECT_EQ(oracle_->TotalRegistered(), 0u);

    // The failed attempt did not consume an id
    Register();
    EXPECT_EQ(oracle_->GetRecord(lpAddr_).oracleId, 0u);
}

TEST_F(NebulaOracleTest, RejectedDecimalsAreLogged) {
    std::vector<util::LogEntry> warnings;
    auto sink = std::make_shared<util::CallbackSink>(
        [&](const util::LogEntry& entry) { warnings.push_back(entry); }, util::LogLevel::Warn);
    util::Logger::Instance().AddSink(sink);

    Address badAddr = Address::FromSeed(0xBADF);
    chain_.AddFeed(badAddr, std::make_shared<chain::MemoryPriceFeed>("BAD / USD", 19, 1));
    std::vector<Address> feeds = {feed0Addr_, badAddr};
    OracleErrc code = Capture([&] { oracle_->RegisterLiquidityToken(registrar_, lpAddr_, feeds); });
    util::Logger::Instance().RemoveSink(sink);

    EXPECT_EQ(code, OracleErrc::DecimalsTooLarge);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].level, util::LogLevel::Warn);
    EXPECT_EQ(warnings[0].category, util::LogCategory::ORACLE);
    EXPECT_NE(warnings[0].message.find(badAddr.ToHex()), std::string::npos);
    EXPECT_NE(warnings[0].message.find("19 decimals"), std::string::npos);
}

TEST_F(NebulaOracleTest, TokenWithZeroDecimals) {
    chain_.AddAsset(token1Addr_, std::make_shared<chain::MemoryAsset>("Broken", 0));
    EXPECT_EQ(Capture([&] { Register(); }), OracleErrc::DecimalsZero);
}

TEST_F(NebulaOracleTest, IdsFollowRegistrationOrder) {
    Address secondLp = Address::FromSeed(0x2B);
    AddPool(secondLp);

    Register();
    oracle_->RegisterLiquidityToken(registrar_, secondLp, Feeds());

    EXPECT_EQ(oracle_->GetRecord(secondLp).oracleId, 1u);
    EXPECT_EQ(oracle_->AllRegistered(), (std::vector<Address>{lpAddr_, secondLp}));
    EXPECT_THROW(oracle_->RegisteredAt(2), std::out_of_range);
}

// ============================================================================
// Pricing
// ============================================================================

TEST_F(NebulaOracleTest, WorkedExample) {
    Register();
    EXPECT_EQ(oracle_->PriceOf(lpAddr_), Units(40));
}

TEST_F(NebulaOracleTest, PriceIsDeterministic) {
    Register();
    UInt256 first = oracle_->PriceOf(lpAddr_);
    EXPECT_EQ(oracle_->PriceOf(lpAddr_), first);
    EXPECT_EQ(oracle_->PriceOf(lpAddr_), first);
}

TEST_F(NebulaOracleTest, PriceIgnoresMovesAlongInvariant) {
    Register();
    UInt256 before = oracle_->PriceOf(lpAddr_);

    // A swap that keeps r0 * r1 constant but skews the spot ratio 4x
    pool_->SetReserves(Units(2000), Units(2000, 6));
    EXPECT_EQ(oracle_->PriceOf(lpAddr_), before);
}

TEST_F(NebulaOracleTest, PriceScalesWithSupply) {
    Register();
    pool_->SetTotalSupply(Units(200));
    EXPECT_EQ(oracle_->PriceOf(lpAddr_), Units(20));
}

TEST_F(NebulaOracleTest, PriceInExpensiveDenomination) {
    Register();
    daiFeed_->SetAnswer(200000000);
    EXPECT_EQ(oracle_->PriceOf(lpAddr_), Units(20));
}

TEST_F(NebulaOracleTest, PriceInSixDecimalDenomination) {
    Address usdcAddr = Address::FromSeed(0x05DC);
    chain_.AddAsset(usdcAddr, std::make_shared<chain::MemoryAsset>("USD Coin", 6));

    OracleSettings settings = settings_;
    settings.denominationToken = usdcAddr;
    oracle_ = MakeOracle(settings);
    EXPECT_EQ(oracle_->Decimals(), 6);

    Register();
    EXPECT_EQ(oracle_->PriceOf(lpAddr_), Units(40, 6));
}

TEST_F(NebulaOracleTest, PriceOfUnregistered) {
    EXPECT_EQ(Capture([&] { oracle_->PriceOf(lpAddr_); }), OracleErrc::PairNotInitialized);
    EXPECT_EQ(Capture([&] { oracle_->AssetPrices(lpAddr_); }), OracleErrc::PairNotInitialized);
}

TEST_F(NebulaOracleTest, PriceWhilePoolLocked) {
    Register();
    pool_->SetLocked(true);
    EXPECT_EQ(Capture([&] { oracle_->PriceOf(lpAddr_); }), OracleErrc::AlreadyInContext);

    pool_->SetLocked(false);
    EXPECT_EQ(oracle_->PriceOf(lpAddr_), Units(40));
}

TEST_F(NebulaOracleTest, ContextGuardDisabled) {
    OracleSettings settings = settings_;
    settings.contextGuard = false;
    oracle_ = MakeOracle(settings);
    Register();

    pool_->SetLocked(true);
    EXPECT_EQ(oracle_->PriceOf(lpAddr_), Units(40));
}

TEST_F(NebulaOracleTest, ZeroSupply) {
    Register();
    pool_->SetTotalSupply(0);
    EXPECT_EQ(Capture([&] { oracle_->PriceOf(lpAddr_); }), OracleErrc::DivisionByZero);
}

TEST_F(NebulaOracleTest, ZeroDenominationPrice) {
    Register();
    daiFeed_->SetAnswer(0);
    EXPECT_EQ(Capture([&] { oracle_->PriceOf(lpAddr_); }), OracleErrc::DivisionByZero);
}

TEST_F(NebulaOracleTest, NegativeFeedAnswer) {
    Register();
    feed1_->SetAnswer(-5);
    EXPECT_EQ(Capture([&] { oracle_->PriceOf(lpAddr_); }), OracleErrc::InvalidFeedValue);
    EXPECT_EQ(Capture([&] { oracle_->AssetPrices(lpAddr_); }), OracleErrc::InvalidFeedValue);
}

TEST_F(NebulaOracleTest, EmptyPoolPricesAtZero) {
    Register();
    pool_->SetReserves(0, 0);
    EXPECT_EQ(oracle_->PriceOf(lpAddr_), 0);
}

TEST_F(NebulaOracleTest, AssetPricesInPoolTokenOrder) {
    Register();
    std::vector<UInt256> prices = oracle_->AssetPrices(lpAddr_);
    ASSERT_EQ(prices.size(), 2u);
    EXPECT_EQ(prices[0], Units(2));
    EXPECT_EQ(prices[1], Units(5, 17));
}

TEST_F(NebulaOracleTest, AssetPricesDividedByDenomination) {
    Register();
    daiFeed_->SetAnswer(200000000);
    std::vector<UInt256> prices = oracle_->AssetPrices(lpAddr_);
    EXPECT_EQ(prices[0], Units(1));
    EXPECT_EQ(prices[1], Units(25, 16));
}

TEST_F(NebulaOracleTest, AssetPricesIgnoreLock) {
    Register();
    pool_->SetLocked(true);
    EXPECT_EQ(oracle_->AssetPrices(lpAddr_).size(), 2u);
}

// ============================================================================
// Removal
// ============================================================================

TEST_F(NebulaOracleTest, RemoveLeavesTombstone) {
    Register();
    oracle_->RemoveLiquidityToken(admin_, lpAddr_);

    EXPECT_FALSE(oracle_->IsRegistered(lpAddr_));
    EXPECT_EQ(oracle_->GetRecord(lpAddr_), OracleRecord());
    EXPECT_EQ(oracle_->TotalRegistered(), 1u);
    EXPECT_TRUE(oracle_->RegisteredAt(0).IsNull());
    EXPECT_EQ(Capture([&] { oracle_->PriceOf(lpAddr_); }), OracleErrc::PairNotInitialized);
}

TEST_F(NebulaOracleTest, ReRegisterAfterRemoveGetsFreshId) {
    Register();
    oracle_->RemoveLiquidityToken(admin_, lpAddr_);
    Register();

    EXPECT_EQ(oracle_->GetRecord(lpAddr_).oracleId, 1u);
    EXPECT_EQ(oracle_->TotalRegistered(), 2u);
    EXPECT_EQ(oracle_->AllRegistered(), (std::vector<Address>{Address(), lpAddr_}));
    EXPECT_EQ(oracle_->PriceOf(lpAddr_), Units(40));
}

TEST_F(NebulaOracleTest, RemoveRequiresAdmin) {
    Register();
    EXPECT_EQ(Capture([&] { oracle_->RemoveLiquidityToken(registrar_, lpAddr_); }),
              OracleErrc::MsgSenderNotAdmin);
    EXPECT_TRUE(oracle_->IsRegistered(lpAddr_));
}

TEST_F(NebulaOracleTest, RemoveUnregistered) {
    EXPECT_EQ(Capture([&] { oracle_->RemoveLiquidityToken(admin_, lpAddr_); }),
              OracleErrc::PairNotInitialized);
}

// ============================================================================
// Admin
// ============================================================================

TEST_F(NebulaOracleTest, AdminTransfer) {
    oracle_->ProposeAdmin(admin_, outsider_);
    EXPECT_EQ(oracle_->PendingAdmin(), outsider_);
    oracle_->AcceptAdmin(outsider_);

    EXPECT_EQ(oracle_->Admin(), outsider_);
    Register();
    EXPECT_EQ(Capture([&] { oracle_->RemoveLiquidityToken(admin_, lpAddr_); }),
              OracleErrc::MsgSenderNotAdmin);
    EXPECT_NO_THROW(oracle_->RemoveLiquidityToken(outsider_, lpAddr_));
}

TEST_F(NebulaOracleTest, AdminTransferErrors) {
    oracle_->ProposeAdmin(admin_, outsider_);
    EXPECT_EQ(Capture([&] { oracle_->ProposeAdmin(admin_, outsider_); }),
              OracleErrc::PendingAdminAlreadySet);

    oracle_->AcceptAdmin(admin_);
    EXPECT_EQ(Capture([&] { oracle_->AcceptAdmin(outsider_); }), OracleErrc::AdminCantBeZero);
}

// ============================================================================
// Events
// ============================================================================

TEST_F(NebulaOracleTest, RegistrationEvent) {
    std::vector<OracleRecord> seen;
    oracle_->OnLiquidityTokenRegistered([&](const OracleRecord& r) { seen.push_back(r); });

    Register();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], oracle_->GetRecord(lpAddr_));

    EXPECT_THROW(Register(), OracleError);
    EXPECT_EQ(seen.size(), 1u);
}

TEST_F(NebulaOracleTest, RemovalEvent) {
    std::vector<OracleRecord> seen;
    oracle_->OnLiquidityTokenRemoved([&](const OracleRecord& r) { seen.push_back(r); });

    Register();
    OracleRecord registered = oracle_->GetRecord(lpAddr_);
    oracle_->RemoveLiquidityToken(admin_, lpAddr_);

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], registered);
}

TEST_F(NebulaOracleTest, AdminEvents) {
    std::vector<std::pair<Address, Address>> pending;
    std::vector<std::pair<Address, Address>> accepted;
    oracle_->OnNewPendingAdmin([&](const Address& a, const Address& b) {
        pending.emplace_back(a, b);
    });
    oracle_->OnNewAdmin([&](const Address& a, const Address& b) {
        accepted.emplace_back(a, b);
    });

    oracle_->ProposeAdmin(admin_, outsider_);
    oracle_->AcceptAdmin(admin_);

    ASSERT_EQ(pending.size(), 1u);
    EXPECT_TRUE(pending[0].first.IsNull());
    EXPECT_EQ(pending[0].second, outsider_);
    ASSERT_EQ(accepted.size(), 1u);
    EXPECT_EQ(accepted[0].first, admin_);
    EXPECT_EQ(accepted[0].second, outsider_);
}

TEST_F(NebulaOracleTest, CallbackMayQueryOracle) {
    UInt256 priceInCallback;
    oracle_->OnLiquidityTokenRegistered([&](const OracleRecord& r) {
        priceInCallback = oracle_->PriceOf(r.underlying);
    });
    Register();
    EXPECT_EQ(priceInCallback, Units(40));
}

// ============================================================================
// Record
// ============================================================================

TEST_F(NebulaOracleTest, RecordToString) {
    Register();
    std::string text = oracle_->GetRecord(lpAddr_).ToString();
    EXPECT_NE(text.find("id=0"), std::string::npos);
    EXPECT_NE(text.find("WAVAX/USDC LP"), std::string::npos);
    EXPECT_EQ(text.find("uninitialized"), std::string::npos);
}

} // namespace
} // namespace oracle
} // namespace nebula
