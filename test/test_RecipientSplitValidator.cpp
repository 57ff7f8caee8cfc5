#include <gtest/gtest.h>
#include "AuctionTestSupport.hpp"
#include "RecipientSplitValidator.hpp"
#include <cctype>

using namespace auction;
using namespace auction::testing_support;

class RecipientSplitValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(CryptoBase::initialize());
    }

    std::vector<RecipientData> splits(const std::vector<uint16_t>& bps) {
        std::vector<RecipientData> result;
        for (size_t i = 0; i < bps.size(); ++i) {
            result.push_back(RecipientData{addressOf("recipient-" + std::to_string(i)), bps[i]});
        }
        return result;
    }

    RecipientSplitValidator validator;
    AuctionKey key{1, 1};
};

// ============================================================================
// SECCIÓN 1: LISTAS VÁLIDAS
// ============================================================================

TEST_F(RecipientSplitValidatorTest, AcceptsOneToFiveRecipientsSummingToMax) {
    EXPECT_NO_THROW(RecipientSplitValidator::validate(splits({10000})));
    EXPECT_NO_THROW(RecipientSplitValidator::validate(splits({5000, 5000})));
    EXPECT_NO_THROW(RecipientSplitValidator::validate(splits({2000, 2000, 2000, 2000, 2000})));
    EXPECT_NO_THROW(RecipientSplitValidator::validate(splits({1, 9999})));
}

TEST_F(RecipientSplitValidatorTest, StoreNormalizesAddresses) {
    std::string upper = addressOf("r1");
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    validator.store(key, {RecipientData{"0x" + upper, BPS_MAX}});

    ASSERT_EQ(validator.recipients(key).size(), 1u);
    EXPECT_EQ(validator.recipients(key)[0].recipient, addressOf("r1"));
}

TEST_F(RecipientSplitValidatorTest, UnknownKeyHasNoRecipients) {
    EXPECT_TRUE(validator.recipients(AuctionKey{9, 9}).empty());
}

// ============================================================================
// SECCIÓN 2: LISTAS INVÁLIDAS
// ============================================================================

TEST_F(RecipientSplitValidatorTest, EmptyListIsInvalid) {
    EXPECT_AUCTION_ERROR(RecipientSplitValidator::validate({}), AuctionErrorCode::INVALID_RECIPIENT_SPLITS);
}

TEST_F(RecipientSplitValidatorTest, MoreThanFiveIsRejected) {
    EXPECT_AUCTION_ERROR(RecipientSplitValidator::validate(splits({2000, 2000, 2000, 2000, 1000, 1000})),
                         AuctionErrorCode::TOO_MANY_RECIPIENTS);
}

TEST_F(RecipientSplitValidatorTest, ZeroSplitIsRejected) {
    EXPECT_AUCTION_ERROR(RecipientSplitValidator::validate(splits({10000, 0})),
                         AuctionErrorCode::RECIPIENT_SPLIT_CANNOT_BE_ZERO);
}

TEST_F(RecipientSplitValidatorTest, WrongSumIsRejected) {
    EXPECT_AUCTION_ERROR(RecipientSplitValidator::validate(splits({5000, 4999})),
                         AuctionErrorCode::INVALID_RECIPIENT_SPLITS);
    EXPECT_AUCTION_ERROR(RecipientSplitValidator::validate(splits({6000, 6000})),
                         AuctionErrorCode::INVALID_RECIPIENT_SPLITS);
}

TEST_F(RecipientSplitValidatorTest, InvalidAddressIsRejected) {
    EXPECT_AUCTION_ERROR(RecipientSplitValidator::validate({RecipientData{"not-an-address", BPS_MAX}}),
                         AuctionErrorCode::INIT_PARAMS_INVALID);
}

TEST_F(RecipientSplitValidatorTest, RejectedListIsNotStored) {
    EXPECT_THROW(validator.store(key, splits({5000})), AuctionError);
    EXPECT_TRUE(validator.recipients(key).empty());
    EXPECT_TRUE(validator.all().empty());
}
