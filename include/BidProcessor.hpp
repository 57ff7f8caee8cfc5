#ifndef COLLECT_AUCTION_BID_PROCESSOR_HPP
#define COLLECT_AUCTION_BID_PROCESSOR_HPP

#include "AuctionError.hpp"
#include "AuctionEvents.hpp"
#include "AuctionRegistry.hpp"
#include "Collaborators.hpp"
#include "ReferralTracker.hpp"
#include <vector>

namespace auction {

    /**
     * Valida y aplica pujas:
     *   NotStarted --primera puja--> Open --now > end--> Ended
     *
     * El reembolso al ganador anterior y el cobro al nuevo pujador se
     * liquidan en un solo lote ordenado (reembolso primero). El registro y
     * la atribución de referidos solo se escriben si la liquidación tiene éxito.
     */
    class BidProcessor {
        public:
            BidProcessor(AuctionRegistry& registry,
                         ReferralTracker& referrals,
                         CurrencyRegistry& currencies,
                         const ProfileRegistry& profiles,
                         const FollowGraph& followGraph,
                         const Clock& clock,
                         const Address& escrowAddress);

            BidPlacedEvent placeBid(const BidParams& params);

            // Helpers de validación (públicos para tests)
            static void checkAvailability(const AuctionData& data, Timestamp now);
            static void checkAmount(const AuctionData& data, const Amount& amount);
            static Timestamp nextEndTimestamp(const AuctionData& data, Timestamp now);

        private:
            void checkFollower(const AuctionKey& key, const AuctionData& data, ProfileId bidderId) const;
            std::vector<TransferLeg> buildEscrowLegs(const AuctionData& data, const BidParams& params) const;

            AuctionRegistry& registry;
            ReferralTracker& referrals;
            CurrencyRegistry& currencies;
            const ProfileRegistry& profiles;
            const FollowGraph& followGraph;
            const Clock& clock;
            Address escrowAddress;
    };

} // namespace auction

#endif // COLLECT_AUCTION_BID_PROCESSOR_HPP
