#include "BidProcessor.hpp"
#include "AddressManager.hpp"

namespace auction {

    BidProcessor::BidProcessor(AuctionRegistry& registry,
                               ReferralTracker& referrals,
                               CurrencyRegistry& currencies,
                               const ProfileRegistry& profiles,
                               const FollowGraph& followGraph,
                               const Clock& clock,
                               const Address& escrowAddress)
        : registry(registry),
          referrals(referrals),
          currencies(currencies),
          profiles(profiles),
          followGraph(followGraph),
          clock(clock),
          escrowAddress(escrowAddress) {}

    // ------------------------------------------------------------
    // VALIDACIONES
    // ------------------------------------------------------------
    void BidProcessor::checkAvailability(const AuctionData& data, Timestamp now) {
        // duration == 0 también cubre claves nunca inicializadas
        if (data.duration == 0) {
            throw AuctionError(AuctionErrorCode::UNAVAILABLE_AUCTION, "auction is not initialized");
        }

        if (now < data.availableSinceTimestamp) {
            throw AuctionError(AuctionErrorCode::UNAVAILABLE_AUCTION,
                               "bids accepted from " + std::to_string(data.availableSinceTimestamp));
        }

        if (data.hasStarted() && now > data.endTimestamp) {
            throw AuctionError(AuctionErrorCode::UNAVAILABLE_AUCTION,
                               "auction ended at " + std::to_string(data.endTimestamp));
        }
    }

    void BidProcessor::checkAmount(const AuctionData& data, const Amount& amount) {
        if (!data.hasWinner()) {
            if (amount < data.reservePrice) {
                throw AuctionError(AuctionErrorCode::INSUFFICIENT_BID_AMOUNT,
                                   "reserve price is " + amountToString(data.reservePrice));
            }
            return;
        }

        if (amount <= data.winningBid) {
            throw AuctionError(AuctionErrorCode::INSUFFICIENT_BID_AMOUNT,
                               "current winning bid is " + amountToString(data.winningBid));
        }

        if (amount - data.winningBid < data.minBidIncrement) {
            throw AuctionError(AuctionErrorCode::INSUFFICIENT_BID_AMOUNT,
                               "minimum increment is " + amountToString(data.minBidIncrement));
        }
    }

    Timestamp BidProcessor::nextEndTimestamp(const AuctionData& data, Timestamp now) {
        if (!data.hasWinner()) {
            return now + data.duration;
        }

        // Anti-sniping: la subasta no puede cerrar antes de minTimeAfterBid
        if (data.endTimestamp - now < data.minTimeAfterBid) {
            return now + data.minTimeAfterBid;
        }
        return data.endTimestamp;
    }

    void BidProcessor::checkFollower(const AuctionKey& key, const AuctionData& data, ProfileId bidderId) const {
        if (!data.onlyFollowers || bidderId == key.creatorId) {
            return;
        }

        if (!followGraph.isFollowing(bidderId, key.creatorId)) {
            throw AuctionError(AuctionErrorCode::NOT_FOLLOWING,
                               "profile " + std::to_string(bidderId) + " does not follow " +
                               std::to_string(key.creatorId));
        }
    }

    std::vector<TransferLeg> BidProcessor::buildEscrowLegs(const AuctionData& data, const BidParams& params) const {
        std::vector<TransferLeg> legs;

        // 1. Reembolso al ganador anterior con fondos ya custodiados
        if (data.hasWinner() && data.winningBid > 0) {
            legs.push_back(TransferLeg{escrowAddress, profiles.ownerOf(data.winnerId), data.winningBid});
        }

        // 2. Cobro de la nueva puja
        if (params.amount > 0) {
            legs.push_back(TransferLeg{params.transactionExecutor, escrowAddress, params.amount});
        }

        return legs;
    }

    // ------------------------------------------------------------
    // PUJA
    // ------------------------------------------------------------
    BidPlacedEvent BidProcessor::placeBid(const BidParams& params) {
        if (params.bidderId == NO_PROFILE) {
            throw AuctionError(AuctionErrorCode::INVALID_PAYLOAD, "bidder profile is required");
        }
        if (!AddressManager::isValidAddress(params.transactionExecutor)) {
            throw AuctionError(AuctionErrorCode::INVALID_PAYLOAD,
                               "invalid transaction executor '" + params.transactionExecutor + "'");
        }

        const Timestamp now = clock.now();
        const AuctionData data = registry.read(params.key);

        checkAvailability(data, now);
        checkAmount(data, params.amount);
        checkFollower(params.key, data, params.bidderId);

        const std::vector<ProfileId> effectiveReferrers =
            referrals.resolve(params.key, params.bidderId, params.referrerIds);

        const Timestamp startTimestamp = data.hasStarted() ? data.startTimestamp : now;
        const Timestamp endTimestamp = nextEndTimestamp(data, now);

        const std::vector<TransferLeg> legs = buildEscrowLegs(data, params);
        if (!legs.empty()) {
            currencies.currency(data.currency).settle(escrowAddress, legs);
        }

        // La liquidación fue correcta: ahora sí se escribe el estado
        registry.applyBid(params.key, params.amount, params.bidderId, startTimestamp, endTimestamp);
        referrals.registerReferrers(params.key, params.bidderId, params.referrerIds);

        BidPlacedEvent event;
        event.key = params.key;
        event.referrerIds = effectiveReferrers;
        event.amount = params.amount;
        event.transactionExecutor = params.transactionExecutor;
        event.bidderId = params.bidderId;
        event.bidderOwnerAddress = params.bidderOwnerAddress;
        event.endTimestamp = endTimestamp;
        event.timestamp = now;
        return event;
    }

} // namespace auction
