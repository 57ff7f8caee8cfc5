#include "ReferralTracker.hpp"
#include "AuctionError.hpp"
#include <algorithm>

namespace auction {

    std::vector<ProfileId> ReferralTracker::sanitize(ProfileId bidderId, const std::vector<ProfileId>& referrerIds) {
        if (referrerIds.size() > MAX_REFERRERS) {
            throw AuctionError(AuctionErrorCode::INVALID_PAYLOAD,
                               "too many referrers: " + std::to_string(referrerIds.size()) +
                               " (max " + std::to_string(MAX_REFERRERS) + ")");
        }

        std::vector<ProfileId> result;
        result.reserve(referrerIds.size());
        for (ProfileId referrer : referrerIds) {
            if (referrer == NO_PROFILE || referrer == bidderId) continue;
            if (std::find(result.begin(), result.end(), referrer) != result.end()) continue;
            result.push_back(referrer);
        }
        return result;
    }

    std::vector<ProfileId> ReferralTracker::resolve(const AuctionKey& key, ProfileId bidderId,
                                                    const std::vector<ProfileId>& referrerIds) const {
        auto auctionIt = table.find(key);
        if (auctionIt != table.end()) {
            auto bidderIt = auctionIt->second.find(bidderId);
            if (bidderIt != auctionIt->second.end()) {
                return bidderIt->second;
            }
        }
        return sanitize(bidderId, referrerIds);
    }

    std::vector<ProfileId> ReferralTracker::registerReferrers(const AuctionKey& key, ProfileId bidderId,
                                                              const std::vector<ProfileId>& referrerIds) {
        BidderReferrals& bidders = table[key];
        auto it = bidders.find(bidderId);
        if (it != bidders.end()) {
            return it->second;
        }

        std::vector<ProfileId> effective = sanitize(bidderId, referrerIds);
        bidders.emplace(bidderId, effective);
        return effective;
    }

    bool ReferralTracker::hasAttribution(const AuctionKey& key, ProfileId bidderId) const {
        auto auctionIt = table.find(key);
        return auctionIt != table.end() && auctionIt->second.count(bidderId) > 0;
    }

    std::vector<ProfileId> ReferralTracker::referrersOf(const AuctionKey& key, ProfileId bidderId) const {
        auto auctionIt = table.find(key);
        if (auctionIt == table.end()) return {};

        auto bidderIt = auctionIt->second.find(bidderId);
        if (bidderIt == auctionIt->second.end()) return {};

        return bidderIt->second;
    }

    void ReferralTracker::restore(const ReferralTable& snapshot) {
        table = snapshot;
    }

} // namespace auction
