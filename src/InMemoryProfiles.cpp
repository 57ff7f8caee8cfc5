#include "InMemoryProfiles.hpp"
#include "AddressManager.hpp"
#include <stdexcept>

namespace auction {

    // ------------------------------------------------------------
    // PERFILES
    // ------------------------------------------------------------
    ProfileId InMemoryProfileRegistry::createProfile(const Address& owner) {
        const ProfileId profileId = nextProfileId++;
        owners[profileId] = AddressManager::normalizeAddress(owner);
        return profileId;
    }

    void InMemoryProfileRegistry::transferProfile(ProfileId profileId, const Address& newOwner) {
        auto it = owners.find(profileId);
        if (it == owners.end()) {
            throw std::invalid_argument("Unknown profile " + std::to_string(profileId));
        }
        it->second = AddressManager::normalizeAddress(newOwner);
    }

    bool InMemoryProfileRegistry::exists(ProfileId profileId) const {
        return owners.count(profileId) > 0;
    }

    Address InMemoryProfileRegistry::ownerOf(ProfileId profileId) const {
        auto it = owners.find(profileId);
        if (it == owners.end()) {
            throw std::invalid_argument("Unknown profile " + std::to_string(profileId));
        }
        return it->second;
    }

    // ------------------------------------------------------------
    // SEGUIDORES
    // ------------------------------------------------------------
    void InMemoryFollowGraph::follow(ProfileId followerId, ProfileId followedId) {
        if (followerId == NO_PROFILE || followedId == NO_PROFILE) {
            throw std::invalid_argument("Profile id 0 cannot follow or be followed");
        }
        edges.insert({followerId, followedId});
    }

    void InMemoryFollowGraph::unfollow(ProfileId followerId, ProfileId followedId) {
        edges.erase({followerId, followedId});
    }

    bool InMemoryFollowGraph::isFollowing(ProfileId followerId, ProfileId followedId) const {
        return edges.count({followerId, followedId}) > 0;
    }

    // ------------------------------------------------------------
    // GOBERNANZA
    // ------------------------------------------------------------
    StaticGovernance::StaticGovernance(const Address& treasury, uint16_t treasuryFeeBps) {
        setTreasury(treasury);
        setTreasuryFee(treasuryFeeBps);
    }

    void StaticGovernance::setTreasury(const Address& treasury) {
        data.treasury = AddressManager::normalizeAddress(treasury);
    }

    void StaticGovernance::setTreasuryFee(uint16_t treasuryFeeBps) {
        if (treasuryFeeBps > BPS_MAX) {
            throw std::invalid_argument("Treasury fee exceeds " + std::to_string(BPS_MAX) + " bps");
        }
        data.treasuryFeeBps = treasuryFeeBps;
    }

} // namespace auction
