#include <gtest/gtest.h>
#include "AuctionTypes.hpp"
#include "AuctionError.hpp"
#include <limits>

using namespace auction;

// ============================================================================
// SECCIÓN 1: ARITMÉTICA DE IMPORTES
// ============================================================================

TEST(AuctionTypesTest, BpsOfTruncates) {
    EXPECT_EQ(bpsOf(Amount(10000), 1000), 1000);
    EXPECT_EQ(bpsOf(Amount(9999), 1), 0);
    EXPECT_EQ(bpsOf(Amount(12345), BPS_MAX), 12345);
    EXPECT_EQ(bpsOf(Amount(0), 5000), 0);
}

TEST(AuctionTypesTest, ParseAmountWithDecimals) {
    EXPECT_EQ(parseAmount("1", 18), Amount("1000000000000000000"));
    EXPECT_EQ(parseAmount("0.001", 18), Amount("1000000000000000"));
    EXPECT_EQ(parseAmount(".5", 1), 5);
    EXPECT_EQ(parseAmount("42"), 42);
}

TEST(AuctionTypesTest, ParseAmountRejectsGarbage) {
    EXPECT_THROW(parseAmount(""), std::invalid_argument);
    EXPECT_THROW(parseAmount("."), std::invalid_argument);
    EXPECT_THROW(parseAmount("1.5"), std::invalid_argument);      // sin decimales
    EXPECT_THROW(parseAmount("1.0001", 3), std::invalid_argument);
    EXPECT_THROW(parseAmount("-1"), std::invalid_argument);
    EXPECT_THROW(parseAmount("12a"), std::invalid_argument);
    EXPECT_THROW(parseAmount(std::string(80, '9')), std::invalid_argument);
}

TEST(AuctionTypesTest, AmountOverflowThrows) {
    Amount max = (std::numeric_limits<Amount>::max)();
    EXPECT_THROW(max + 1, std::overflow_error);
    EXPECT_THROW(Amount(0) - 1, std::range_error);
}

TEST(AuctionTypesTest, AmountWordIsBigEndian) {
    std::vector<uint8_t> word = amountToBytes(Amount(0x0102));
    ASSERT_EQ(word.size(), ABI_WORD_SIZE);
    EXPECT_EQ(word[30], 0x01);
    EXPECT_EQ(word[31], 0x02);
    EXPECT_EQ(word[0], 0x00);

    EXPECT_EQ(amountFromBytes(word.data(), word.size()), 0x0102);
    EXPECT_THROW(amountFromBytes(word.data(), 33), std::invalid_argument);
}

// ============================================================================
// SECCIÓN 2: ESTADO DERIVADO
// ============================================================================

TEST(AuctionTypesTest, StateTransitions) {
    AuctionData data;
    data.duration = 60;
    EXPECT_EQ(auctionStateAt(data, 100), AuctionState::NOT_STARTED);

    data.startTimestamp = 100;
    data.endTimestamp = 160;
    data.winnerId = 2;
    EXPECT_EQ(auctionStateAt(data, 100), AuctionState::OPEN);
    EXPECT_EQ(auctionStateAt(data, 160), AuctionState::OPEN);
    EXPECT_EQ(auctionStateAt(data, 161), AuctionState::ENDED);

    EXPECT_EQ(auctionStateToString(AuctionState::ENDED), "Ended");
}

TEST(AuctionTypesTest, KeyEqualityAndHash) {
    AuctionKey a{1, 2};
    AuctionKey b{1, 2};
    AuctionKey c{2, 1};

    EXPECT_TRUE(a == b);
    EXPECT_TRUE(a != c);
    EXPECT_EQ(AuctionKeyHash{}(a), AuctionKeyHash{}(b));
    EXPECT_EQ(a.toString(), "1/2");
}

TEST(AuctionTypesTest, ErrorCarriesCodeAndName) {
    AuctionError error(AuctionErrorCode::ONGOING_AUCTION, "ends at 10");
    EXPECT_EQ(error.code(), AuctionErrorCode::ONGOING_AUCTION);
    EXPECT_STREQ(error.what(), "OngoingAuction: ends at 10");
    EXPECT_EQ(errorCodeToString(AuctionErrorCode::FEE_ALREADY_PROCESSED), "FeeAlreadyProcessed");
}
