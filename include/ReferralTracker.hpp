#ifndef COLLECT_AUCTION_REFERRAL_TRACKER_HPP
#define COLLECT_AUCTION_REFERRAL_TRACKER_HPP

#include "AuctionTypes.hpp"
#include <unordered_map>
#include <vector>

namespace auction {

    using BidderReferrals = std::unordered_map<ProfileId, std::vector<ProfileId>>;
    using ReferralTable = std::unordered_map<AuctionKey, BidderReferrals, AuctionKeyHash>;

    /**
     * Atribución de referidos por pujador y subasta. Solo la primera puja de
     * cada pujador fija la lista; las siguientes se ignoran.
     */
    class ReferralTracker {
        public:
            /**
             * Lista efectiva para el pujador sin modificar el estado: la ya
             * guardada si existe, si no la candidata saneada.
             */
            std::vector<ProfileId> resolve(const AuctionKey& key, ProfileId bidderId,
                                           const std::vector<ProfileId>& referrerIds) const;

            /** Guarda la lista si el pujador aún no tiene ninguna; devuelve la efectiva */
            std::vector<ProfileId> registerReferrers(const AuctionKey& key, ProfileId bidderId,
                                                     const std::vector<ProfileId>& referrerIds);

            bool hasAttribution(const AuctionKey& key, ProfileId bidderId) const;
            std::vector<ProfileId> referrersOf(const AuctionKey& key, ProfileId bidderId) const;

            const ReferralTable& all() const { return table; }
            void restore(const ReferralTable& snapshot);

        private:
            // Quita autorreferencias, el perfil nulo y duplicados
            static std::vector<ProfileId> sanitize(ProfileId bidderId, const std::vector<ProfileId>& referrerIds);

            ReferralTable table;
    };

} // namespace auction

#endif // COLLECT_AUCTION_REFERRAL_TRACKER_HPP
