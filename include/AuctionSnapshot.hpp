#ifndef COLLECT_AUCTION_AUCTION_SNAPSHOT_HPP
#define COLLECT_AUCTION_AUCTION_SNAPSHOT_HPP

#include "AuctionRegistry.hpp"
#include "CollectableIssuer.hpp"
#include "RecipientSplitValidator.hpp"
#include "ReferralTracker.hpp"

namespace auction {

    /** Estado completo del módulo (lo que se persiste en disco) */
    struct AuctionSnapshot {
        AuctionTable auctions;
        RecipientTable recipients;
        ReferralTable referrals;
        CollectableTable collectables;
    };

} // namespace auction

#endif // COLLECT_AUCTION_AUCTION_SNAPSHOT_HPP
