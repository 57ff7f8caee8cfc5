#include "AuctionRegistry.hpp"
#include <algorithm>
#include <stdexcept>

namespace auction {

    void AuctionRegistry::create(const AuctionKey& key, const AuctionData& data) {
        auctions[key] = data;
    }

    bool AuctionRegistry::contains(const AuctionKey& key) const {
        return auctions.find(key) != auctions.end();
    }

    AuctionData AuctionRegistry::read(const AuctionKey& key) const {
        auto it = auctions.find(key);
        if (it == auctions.end()) {
            return AuctionData{};
        }
        return it->second;
    }

    AuctionData& AuctionRegistry::mutableRecord(const AuctionKey& key) {
        auto it = auctions.find(key);
        if (it == auctions.end()) {
            throw std::logic_error("No auction registered for " + key.toString());
        }
        return it->second;
    }

    void AuctionRegistry::applyBid(const AuctionKey& key, const Amount& amount, ProfileId winnerId,
                                   Timestamp startTimestamp, Timestamp endTimestamp) {
        AuctionData& record = mutableRecord(key);
        record.winningBid = amount;
        record.winnerId = winnerId;
        record.startTimestamp = startTimestamp;
        record.endTimestamp = endTimestamp;
    }

    void AuctionRegistry::setFlags(const AuctionKey& key, const AuctionFlags& flags) {
        AuctionData& record = mutableRecord(key);
        // Solo false -> true
        if (flags.collected.value_or(false)) {
            record.collected = true;
        }
        if (flags.feeProcessed.value_or(false)) {
            record.feeProcessed = true;
        }
    }

    std::vector<AuctionKey> AuctionRegistry::keys() const {
        std::vector<AuctionKey> result;
        result.reserve(auctions.size());
        for (const auto& [key, data] : auctions) {
            result.push_back(key);
        }
        std::sort(result.begin(), result.end(), [](const AuctionKey& a, const AuctionKey& b) {
            return a.creatorId != b.creatorId ? a.creatorId < b.creatorId : a.contentId < b.contentId;
        });
        return result;
    }

    void AuctionRegistry::restore(const AuctionTable& snapshot) {
        auctions = snapshot;
    }

} // namespace auction
