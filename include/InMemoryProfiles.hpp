#ifndef COLLECT_AUCTION_IN_MEMORY_PROFILES_HPP
#define COLLECT_AUCTION_IN_MEMORY_PROFILES_HPP

#include "Collaborators.hpp"
#include <map>
#include <set>
#include <utility>

namespace auction {

    /** Perfiles transferibles con ids secuenciales desde 1 */
    class InMemoryProfileRegistry : public ProfileRegistry {
        public:
            ProfileId createProfile(const Address& owner);
            void transferProfile(ProfileId profileId, const Address& newOwner);

            bool exists(ProfileId profileId) const override;
            Address ownerOf(ProfileId profileId) const override;

            size_t count() const { return owners.size(); }

        private:
            std::map<ProfileId, Address> owners;
            ProfileId nextProfileId = 1;
    };

    /** Relaciones seguidor -> seguido */
    class InMemoryFollowGraph : public FollowGraph {
        public:
            void follow(ProfileId followerId, ProfileId followedId);
            void unfollow(ProfileId followerId, ProfileId followedId);

            bool isFollowing(ProfileId followerId, ProfileId followedId) const override;

        private:
            std::set<std::pair<ProfileId, ProfileId>> edges;
    };

    /** Tesorería y tasa configurables a mano */
    class StaticGovernance : public Governance {
        public:
            StaticGovernance(const Address& treasury, uint16_t treasuryFeeBps);

            void setTreasury(const Address& treasury);
            void setTreasuryFee(uint16_t treasuryFeeBps);

            TreasuryData getTreasuryData() const override { return data; }

        private:
            TreasuryData data;
    };

} // namespace auction

#endif // COLLECT_AUCTION_IN_MEMORY_PROFILES_HPP
