#include "AuctionError.hpp"

namespace auction {

    namespace {
        std::string buildMessage(AuctionErrorCode code, const std::string& detail) {
            if (detail.empty()) {
                return errorCodeToString(code);
            }
            return errorCodeToString(code) + ": " + detail;
        }
    }

    std::string errorCodeToString(AuctionErrorCode code) {
        switch (code) {
            case AuctionErrorCode::INIT_PARAMS_INVALID:            return "InitParamsInvalid";
            case AuctionErrorCode::TOO_MANY_RECIPIENTS:            return "TooManyRecipients";
            case AuctionErrorCode::RECIPIENT_SPLIT_CANNOT_BE_ZERO: return "RecipientSplitCannotBeZero";
            case AuctionErrorCode::INVALID_RECIPIENT_SPLITS:       return "InvalidRecipientSplits";
            case AuctionErrorCode::UNAVAILABLE_AUCTION:            return "UnavailableAuction";
            case AuctionErrorCode::ONGOING_AUCTION:                return "OngoingAuction";
            case AuctionErrorCode::INSUFFICIENT_BID_AMOUNT:        return "InsufficientBidAmount";
            case AuctionErrorCode::COLLECT_ALREADY_PROCESSED:      return "CollectAlreadyProcessed";
            case AuctionErrorCode::FEE_ALREADY_PROCESSED:          return "FeeAlreadyProcessed";
            case AuctionErrorCode::NOT_FOLLOWING:                  return "NotFollowing";
            case AuctionErrorCode::NOT_HUB:                        return "NotHub";
            case AuctionErrorCode::REENTRANT_CALL:                 return "ReentrantCall";
            case AuctionErrorCode::INVALID_PAYLOAD:                return "InvalidPayload";
            default:                                               return "Unknown";
        }
    }

    AuctionError::AuctionError(AuctionErrorCode code, const std::string& detail)
        : std::runtime_error(buildMessage(code, detail)), code_(code) {}

} // namespace auction
