#include <gtest/gtest.h>
#include "AuctionTestSupport.hpp"
#include "FeeDistributor.hpp"

using namespace auction;
using namespace auction::testing_support;

// ============================================================================
// FIXTURE
// ============================================================================

class FeeDistributorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(CryptoBase::initialize());

        escrow = addressOf("escrow");
        ledger = std::make_shared<InMemoryLedger>(addressOf("token"), "TKN", 18);
        currencies.registerCurrency(ledger);
        governance = std::make_unique<StaticGovernance>(addressOf("treasury"), 1000);

        creatorId = profiles.createProfile(addressOf("creator"));
        winnerId = profiles.createProfile(addressOf("winner"));
        referrerA = profiles.createProfile(addressOf("referrer-a"));
        referrerB = profiles.createProfile(addressOf("referrer-b"));
        referrerC = profiles.createProfile(addressOf("referrer-c"));

        distributor = std::make_unique<FeeDistributor>(registry, referrals, recipients, currencies, profiles,
                                                       *governance, clock, escrow);
    }

    // Subasta terminada con la puja ganadora ya en custodia
    void setupEndedAuction(const Amount& winningBid, uint16_t referralFeeBps,
                           const std::vector<RecipientData>& splits,
                           const std::vector<ProfileId>& winnerReferrers = {}) {
        AuctionData data;
        data.duration = 60;
        data.currency = ledger->address();
        data.referralFeeBps = referralFeeBps;
        registry.create(key, data);
        registry.applyBid(key, winningBid, winnerId, T0 - 100, T0 - 40);
        recipients.store(key, splits);
        referrals.registerReferrers(key, winnerId, winnerReferrers);
        ledger->mint(escrow, winningBid);
    }

    Address escrow;
    ManualClock clock{T0};
    std::shared_ptr<InMemoryLedger> ledger;
    InMemoryCurrencyRegistry currencies;
    InMemoryProfileRegistry profiles;
    std::unique_ptr<StaticGovernance> governance;
    AuctionRegistry registry;
    ReferralTracker referrals;
    RecipientSplitValidator recipients;
    std::unique_ptr<FeeDistributor> distributor;

    AuctionKey key{1, 1};
    ProfileId creatorId = 0;
    ProfileId winnerId = 0;
    ProfileId referrerA = 0;
    ProfileId referrerB = 0;
    ProfileId referrerC = 0;
};

// ============================================================================
// SECCIÓN 1: CÁLCULO DEL REPARTO
// ============================================================================

TEST_F(FeeDistributorTest, ScenarioTreasuryReferralSingleRecipient) {
    PayoutPlan plan = FeeDistributor::computePlan(ether("1.0"), TreasuryData{addressOf("treasury"), 1000}, 1000,
                                                  {addressOf("referrer-a")},
                                                  {RecipientData{addressOf("r1"), 10000}});

    EXPECT_EQ(plan.treasuryAmount, ether("0.1"));
    EXPECT_EQ(plan.referralAmount, ether("0.09"));
    EXPECT_EQ(plan.recipientsAmount, ether("0.81"));

    ASSERT_EQ(plan.payouts.size(), 3u);
    EXPECT_EQ(plan.payouts[0].kind, PayoutKind::TREASURY);
    EXPECT_EQ(plan.payouts[1].kind, PayoutKind::REFERRAL);
    EXPECT_EQ(plan.payouts[1].amount, ether("0.09"));
    EXPECT_EQ(plan.payouts[2].to, addressOf("r1"));
    EXPECT_EQ(plan.totalPaid(), ether("1.0"));
}

TEST_F(FeeDistributorTest, ScenarioTwoRecipientsNoReferral) {
    PayoutPlan plan = FeeDistributor::computePlan(ether("1.0"), TreasuryData{addressOf("treasury"), 1000}, 0, {},
                                                  {RecipientData{addressOf("r1"), 5000},
                                                   RecipientData{addressOf("r2"), 5000}});

    EXPECT_EQ(plan.treasuryAmount, ether("0.1"));
    EXPECT_EQ(plan.referralAmount, 0);
    ASSERT_EQ(plan.payouts.size(), 3u);
    EXPECT_EQ(plan.payouts[1].amount, ether("0.45"));
    EXPECT_EQ(plan.payouts[2].amount, ether("0.45"));
}

TEST_F(FeeDistributorTest, ReferralFeeWithoutReferrersIsSkipped) {
    PayoutPlan plan = FeeDistributor::computePlan(Amount(1000), TreasuryData{addressOf("treasury"), 0}, 5000, {},
                                                  {RecipientData{addressOf("r1"), 10000}});

    EXPECT_EQ(plan.referralAmount, 0);
    EXPECT_EQ(plan.recipientsAmount, 1000);
}

TEST_F(FeeDistributorTest, TruncatedRemaindersStayInEscrow) {
    // 100 -> tesorería 3, ajustado 97 -> referidos 9 (3 c/u), ajustado 88 -> 29 + 29 + 29
    PayoutPlan plan = FeeDistributor::computePlan(
        Amount(100), TreasuryData{addressOf("treasury"), 300}, 1000,
        {addressOf("referrer-a"), addressOf("referrer-b"), addressOf("referrer-c")},
        {RecipientData{addressOf("r1"), 3334}, RecipientData{addressOf("r2"), 3333},
         RecipientData{addressOf("r3"), 3333}});

    EXPECT_EQ(plan.treasuryAmount, 3);
    EXPECT_EQ(plan.referralAmount, 9);
    EXPECT_EQ(plan.recipientsAmount, 29 + 29 + 29);
    EXPECT_LE(plan.totalPaid(), 100);
    EXPECT_EQ(plan.totalPaid(), 3 + 9 + 87);
}

TEST_F(FeeDistributorTest, ZeroPayoutsAreOmitted) {
    PayoutPlan plan = FeeDistributor::computePlan(Amount(1), TreasuryData{addressOf("treasury"), 1000}, 1000,
                                                  {addressOf("referrer-a"), addressOf("referrer-b")},
                                                  {RecipientData{addressOf("r1"), 5000},
                                                   RecipientData{addressOf("r2"), 5000}});
    EXPECT_TRUE(plan.payouts.empty());
    EXPECT_EQ(plan.totalPaid(), 0);
}

TEST_F(FeeDistributorTest, TotalNeverExceedsWinningBid) {
    const std::vector<uint16_t> fees = {0, 1, 999, 5000, 10000};
    for (uint16_t treasuryFee : fees) {
        for (uint16_t referralFee : fees) {
            PayoutPlan plan = FeeDistributor::computePlan(
                ether("3.333333333333333333"), TreasuryData{addressOf("treasury"), treasuryFee}, referralFee,
                {addressOf("referrer-a"), addressOf("referrer-b")},
                {RecipientData{addressOf("r1"), 1}, RecipientData{addressOf("r2"), 9999}});
            EXPECT_LE(plan.totalPaid(), plan.winningBid) << treasuryFee << "/" << referralFee;
        }
    }
}

// ============================================================================
// SECCIÓN 2: LIQUIDACIÓN
// ============================================================================

TEST_F(FeeDistributorTest, DistributePaysResolvedOwners) {
    setupEndedAuction(ether("1.0"), 1000, {RecipientData{addressOf("r1"), 10000}}, {referrerA});
    profiles.transferProfile(referrerA, addressOf("referrer-a-new"));

    FeeProcessedEvent event = distributor->distribute(key);

    EXPECT_EQ(event.winningBid, ether("1.0"));
    EXPECT_EQ(event.timestamp, T0);
    EXPECT_EQ(ledger->balanceOf(addressOf("treasury")), ether("0.1"));
    EXPECT_EQ(ledger->balanceOf(addressOf("referrer-a-new")), ether("0.09"));
    EXPECT_EQ(ledger->balanceOf(addressOf("r1")), ether("0.81"));
    EXPECT_EQ(ledger->balanceOf(escrow), 0);
    EXPECT_TRUE(registry.read(key).feeProcessed);
}

TEST_F(FeeDistributorTest, SecondDistributionFails) {
    setupEndedAuction(ether("1.0"), 0, {RecipientData{addressOf("r1"), 5000}, RecipientData{addressOf("r2"), 5000}});

    distributor->distribute(key);
    EXPECT_AUCTION_ERROR(distributor->distribute(key), AuctionErrorCode::FEE_ALREADY_PROCESSED);
    EXPECT_EQ(ledger->balanceOf(addressOf("r1")), ether("0.45"));
}

TEST_F(FeeDistributorTest, FailedSettlementKeepsFlagUnset) {
    setupEndedAuction(ether("1.0"), 0, {RecipientData{addressOf("r1"), 5000}, RecipientData{addressOf("r2"), 5000}});
    ledger->setBlacklisted(addressOf("r2"), true);

    EXPECT_THROW(distributor->distribute(key), std::runtime_error);
    EXPECT_FALSE(registry.read(key).feeProcessed);
    EXPECT_EQ(ledger->balanceOf(addressOf("treasury")), 0);
    EXPECT_EQ(ledger->balanceOf(escrow), ether("1.0"));

    ledger->setBlacklisted(addressOf("r2"), false);
    EXPECT_NO_THROW(distributor->distribute(key));
}

TEST_F(FeeDistributorTest, PrepareChecksSettlementWithoutMovingFunds) {
    setupEndedAuction(ether("1.0"), 0, {RecipientData{addressOf("r1"), 10000}});

    PreparedDistribution prepared = distributor->prepare(key);
    EXPECT_EQ(prepared.plan.treasuryAmount, ether("0.1"));
    EXPECT_EQ(prepared.legs.size(), 2u);
    EXPECT_EQ(ledger->balanceOf(escrow), ether("1.0"));
    EXPECT_FALSE(registry.read(key).feeProcessed);

    ledger->setBlacklisted(addressOf("treasury"), true);
    EXPECT_THROW(distributor->prepare(key), std::runtime_error);
    ledger->setBlacklisted(addressOf("treasury"), false);

    FeeProcessedEvent event = distributor->commit(prepared);
    EXPECT_EQ(event.recipientsAmount, ether("0.9"));
    EXPECT_EQ(ledger->balanceOf(addressOf("r1")), ether("0.9"));
    EXPECT_TRUE(registry.read(key).feeProcessed);
    EXPECT_AUCTION_ERROR(distributor->prepare(key), AuctionErrorCode::FEE_ALREADY_PROCESSED);
}
