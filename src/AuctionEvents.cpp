#include "AuctionEvents.hpp"

namespace auction {

    namespace {
        std::string joinIds(const std::vector<ProfileId>& ids) {
            std::string result = "[";
            for (size_t i = 0; i < ids.size(); ++i) {
                if (i > 0) result += ",";
                result += std::to_string(ids[i]);
            }
            return result + "]";
        }
    }

    LoggingObserver::LoggingObserver(std::ostream& out) : out(out) {}

    void LoggingObserver::onAuctionCreated(const AuctionCreatedEvent& event) {
        out << "[AUCTION] AuctionCreated key=" << event.key.toString()
            << " creator=" << event.creatorOwnerAddress
            << " availableSince=" << event.params.availableSinceTimestamp
            << " duration=" << event.params.duration
            << " minTimeAfterBid=" << event.params.minTimeAfterBid
            << " reserve=" << amountToString(event.params.reservePrice)
            << " minIncrement=" << amountToString(event.params.minBidIncrement)
            << " referralFeeBps=" << event.params.referralFeeBps
            << " currency=" << event.params.currency
            << " recipients=" << event.params.recipients.size()
            << " onlyFollowers=" << (event.params.onlyFollowers ? "true" : "false")
            << " token=" << event.params.tokenData.name << "/" << event.params.tokenData.symbol
            << std::endl;
    }

    void LoggingObserver::onBidPlaced(const BidPlacedEvent& event) {
        out << "[AUCTION] BidPlaced key=" << event.key.toString()
            << " bidder=" << event.bidderId
            << " amount=" << amountToString(event.amount)
            << " referrers=" << joinIds(event.referrerIds)
            << " end=" << event.endTimestamp
            << " at=" << event.timestamp << std::endl;
    }

    void LoggingObserver::onFeeProcessed(const FeeProcessedEvent& event) {
        out << "[AUCTION] FeeProcessed key=" << event.key.toString()
            << " winningBid=" << amountToString(event.winningBid)
            << " treasury=" << amountToString(event.treasuryAmount)
            << " referral=" << amountToString(event.referralAmount)
            << " recipients=" << amountToString(event.recipientsAmount) << std::endl;
    }

    void LoggingObserver::onCollectableDeployed(const CollectableDeployedEvent& event) {
        out << "[AUCTION] CollectableDeployed key=" << event.key.toString()
            << " collectable=" << event.collectable << std::endl;
    }

    void LoggingObserver::onCollected(const CollectedEvent& event) {
        out << "[AUCTION] Collected key=" << event.key.toString()
            << " winner=" << event.winnerId
            << " to=" << event.winnerAddress
            << " tokenId=" << event.tokenId << std::endl;
    }

} // namespace auction
