#include <gtest/gtest.h>
#include "AuctionTestSupport.hpp"
#include "BidProcessor.hpp"

using namespace auction;
using namespace auction::testing_support;

// ============================================================================
// FIXTURE: procesador aislado sobre colaboradores en memoria
// ============================================================================

class BidProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(CryptoBase::initialize());

        escrow = addressOf("escrow");
        ledger = std::make_shared<InMemoryLedger>(addressOf("token"), "TKN", 18);
        currencies.registerCurrency(ledger);

        creatorId = profiles.createProfile(addressOf("creator"));
        aliceId = profiles.createProfile(addressOf("alice"));
        bobId = profiles.createProfile(addressOf("bob"));

        for (const char* name : {"alice", "bob"}) {
            ledger->mint(addressOf(name), ether("10"));
            ledger->approve(addressOf(name), escrow, ether("10"));
        }

        AuctionData data;
        data.availableSinceTimestamp = T0;
        data.duration = 60;
        data.minTimeAfterBid = 30;
        data.currency = ledger->address();
        registry.create(key(), data);

        processor = std::make_unique<BidProcessor>(registry, referrals, currencies, profiles, followGraph, clock, escrow);
    }

    AuctionKey key() const { return AuctionKey{creatorId, 1}; }

    BidParams bid(ProfileId bidderId, const std::string& amount, const std::vector<ProfileId>& referrers = {}) {
        BidParams params;
        params.key = key();
        params.bidderId = bidderId;
        params.bidderOwnerAddress = profiles.ownerOf(bidderId);
        params.transactionExecutor = params.bidderOwnerAddress;
        params.referrerIds = referrers;
        params.amount = ether(amount);
        return params;
    }

    Address escrow;
    ManualClock clock{T0};
    std::shared_ptr<InMemoryLedger> ledger;
    InMemoryCurrencyRegistry currencies;
    InMemoryProfileRegistry profiles;
    InMemoryFollowGraph followGraph;
    AuctionRegistry registry;
    ReferralTracker referrals;
    std::unique_ptr<BidProcessor> processor;

    ProfileId creatorId = 0;
    ProfileId aliceId = 0;
    ProfileId bobId = 0;
};

// ============================================================================
// SECCIÓN 1: HELPERS DE VALIDACIÓN
// ============================================================================

TEST_F(BidProcessorTest, AvailabilityRules) {
    AuctionData data = registry.read(key());
    EXPECT_NO_THROW(BidProcessor::checkAvailability(data, T0));
    EXPECT_AUCTION_ERROR(BidProcessor::checkAvailability(data, T0 - 1), AuctionErrorCode::UNAVAILABLE_AUCTION);

    data.startTimestamp = T0;
    data.endTimestamp = T0 + 60;
    EXPECT_NO_THROW(BidProcessor::checkAvailability(data, T0 + 60));
    EXPECT_AUCTION_ERROR(BidProcessor::checkAvailability(data, T0 + 61), AuctionErrorCode::UNAVAILABLE_AUCTION);

    EXPECT_AUCTION_ERROR(BidProcessor::checkAvailability(AuctionData{}, T0), AuctionErrorCode::UNAVAILABLE_AUCTION);
}

TEST_F(BidProcessorTest, AmountRules) {
    AuctionData data;
    data.reservePrice = 100;
    data.minBidIncrement = 10;

    EXPECT_AUCTION_ERROR(BidProcessor::checkAmount(data, 99), AuctionErrorCode::INSUFFICIENT_BID_AMOUNT);
    EXPECT_NO_THROW(BidProcessor::checkAmount(data, 100));

    data.winnerId = 2;
    data.winningBid = 100;
    EXPECT_AUCTION_ERROR(BidProcessor::checkAmount(data, 100), AuctionErrorCode::INSUFFICIENT_BID_AMOUNT);
    EXPECT_AUCTION_ERROR(BidProcessor::checkAmount(data, 109), AuctionErrorCode::INSUFFICIENT_BID_AMOUNT);
    EXPECT_NO_THROW(BidProcessor::checkAmount(data, 110));
}

TEST_F(BidProcessorTest, NextEndTimestamp) {
    AuctionData data;
    data.duration = 60;
    data.minTimeAfterBid = 30;
    EXPECT_EQ(BidProcessor::nextEndTimestamp(data, 1000), 1060u);

    data.winnerId = 2;
    data.endTimestamp = 1060;
    EXPECT_EQ(BidProcessor::nextEndTimestamp(data, 1020), 1060u); // quedan 40 s
    EXPECT_EQ(BidProcessor::nextEndTimestamp(data, 1030), 1060u); // quedan 30 s justos
    EXPECT_EQ(BidProcessor::nextEndTimestamp(data, 1059), 1089u);
}

// ============================================================================
// SECCIÓN 2: PUJAS COMPLETAS
// ============================================================================

TEST_F(BidProcessorTest, FirstBidOpensAuction) {
    BidPlacedEvent event = processor->placeBid(bid(aliceId, "1"));

    AuctionData data = registry.read(key());
    EXPECT_EQ(data.startTimestamp, T0);
    EXPECT_EQ(data.endTimestamp, T0 + 60);
    EXPECT_EQ(data.winnerId, aliceId);
    EXPECT_EQ(event.endTimestamp, T0 + 60);
    EXPECT_EQ(event.timestamp, T0);
    EXPECT_EQ(ledger->balanceOf(escrow), ether("1"));
    EXPECT_EQ(ledger->allowance(addressOf("alice"), escrow), ether("9"));
}

TEST_F(BidProcessorTest, OutbidRefundsPreviousWinnerOwner) {
    processor->placeBid(bid(aliceId, "1"));
    profiles.transferProfile(aliceId, addressOf("alice-cold-wallet"));

    clock.advance(10);
    processor->placeBid(bid(bobId, "2"));

    EXPECT_EQ(ledger->balanceOf(addressOf("alice-cold-wallet")), ether("1"));
    EXPECT_EQ(ledger->balanceOf(addressOf("alice")), ether("9"));
    EXPECT_EQ(ledger->balanceOf(escrow), ether("2"));
    EXPECT_EQ(registry.read(key()).startTimestamp, T0);
}

TEST_F(BidProcessorTest, ZeroBidWithZeroReserveMovesNoFunds) {
    processor->placeBid(bid(aliceId, "0"));

    AuctionData data = registry.read(key());
    EXPECT_EQ(data.winnerId, aliceId);
    EXPECT_EQ(data.winningBid, 0);
    EXPECT_EQ(ledger->balanceOf(escrow), 0);
}

TEST_F(BidProcessorTest, FailedSettlementWritesNothing) {
    ledger->approve(addressOf("bob"), escrow, 0);
    processor->placeBid(bid(aliceId, "1"));

    clock.advance(50);
    EXPECT_THROW(processor->placeBid(bid(bobId, "2", {creatorId})), std::runtime_error);

    AuctionData data = registry.read(key());
    EXPECT_EQ(data.winnerId, aliceId);
    EXPECT_EQ(data.endTimestamp, T0 + 60);
    EXPECT_FALSE(referrals.hasAttribution(key(), bobId));
    EXPECT_EQ(ledger->balanceOf(addressOf("alice")), ether("9"));
}

TEST_F(BidProcessorTest, MissingBidderIsInvalidPayload) {
    BidParams params = bid(aliceId, "1");
    params.bidderId = NO_PROFILE;
    EXPECT_AUCTION_ERROR(processor->placeBid(params), AuctionErrorCode::INVALID_PAYLOAD);

    params = bid(aliceId, "1");
    params.transactionExecutor = "nope";
    EXPECT_AUCTION_ERROR(processor->placeBid(params), AuctionErrorCode::INVALID_PAYLOAD);
}

TEST_F(BidProcessorTest, FollowerGate) {
    AuctionData gated = registry.read(key());
    gated.onlyFollowers = true;
    registry.create(AuctionKey{creatorId, 2}, gated);

    BidParams params = bid(aliceId, "1");
    params.key = AuctionKey{creatorId, 2};

    EXPECT_AUCTION_ERROR(processor->placeBid(params), AuctionErrorCode::NOT_FOLLOWING);
    followGraph.follow(aliceId, creatorId);
    EXPECT_NO_THROW(processor->placeBid(params));
}
