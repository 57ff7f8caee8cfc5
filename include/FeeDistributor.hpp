#ifndef COLLECT_AUCTION_FEE_DISTRIBUTOR_HPP
#define COLLECT_AUCTION_FEE_DISTRIBUTOR_HPP

#include "AuctionError.hpp"
#include "AuctionEvents.hpp"
#include "AuctionRegistry.hpp"
#include "Collaborators.hpp"
#include "RecipientSplitValidator.hpp"
#include "ReferralTracker.hpp"
#include <vector>

namespace auction {

    enum class PayoutKind : uint8_t {
        TREASURY  = 1,
        REFERRAL  = 2,
        RECIPIENT = 3
    };

    struct Payout {
        PayoutKind kind = PayoutKind::RECIPIENT;
        Address to;
        Amount amount = 0;
    };

    /** Reparto calculado; nada se ha transferido todavía */
    struct PayoutPlan {
        Amount winningBid = 0;
        Amount treasuryAmount = 0;
        Amount referralAmount = 0;   // totalReferral descontado (incluye el resto truncado)
        Amount recipientsAmount = 0;
        std::vector<Payout> payouts; // solo importes > 0, en orden de pago

        Amount totalPaid() const;
    };

    /** Reparto verificado contra la moneda y listo para liquidar */
    struct PreparedDistribution {
        AuctionKey key;
        Address currency;
        PayoutPlan plan;
        std::vector<TransferLeg> legs;
    };

    /**
     * Reparte la puja ganadora: tesorería, referidos y destinatarios por
     * puntos básicos. Los restos de truncado se quedan en custodia.
     */
    class FeeDistributor {
        public:
            FeeDistributor(AuctionRegistry& registry,
                           const ReferralTracker& referrals,
                           const RecipientSplitValidator& recipients,
                           CurrencyRegistry& currencies,
                           const ProfileRegistry& profiles,
                           const Governance& governance,
                           const Clock& clock,
                           const Address& escrowAddress);

            /** Cálculo puro a partir de los datos ya resueltos */
            static PayoutPlan computePlan(const Amount& winningBid,
                                          const TreasuryData& treasury,
                                          uint16_t referralFeeBps,
                                          const std::vector<Address>& referrerOwners,
                                          const std::vector<RecipientData>& recipients);

            /** Resuelve gobernanza y dueños de referidos y calcula el plan */
            PayoutPlan planFor(const AuctionKey& key, const AuctionData& data) const;

            /**
             * Calcula el plan y comprueba la liquidación sin mover fondos.
             * Lanza FeeAlreadyProcessed si ya se hizo, o el error de la moneda.
             */
            PreparedDistribution prepare(const AuctionKey& key);

            /** Liquida un reparto preparado y marca feeProcessed */
            FeeProcessedEvent commit(const PreparedDistribution& prepared);

            /** prepare + commit */
            FeeProcessedEvent distribute(const AuctionKey& key);

        private:
            AuctionRegistry& registry;
            const ReferralTracker& referrals;
            const RecipientSplitValidator& recipients;
            CurrencyRegistry& currencies;
            const ProfileRegistry& profiles;
            const Governance& governance;
            const Clock& clock;
            Address escrowAddress;
    };

} // namespace auction

#endif // COLLECT_AUCTION_FEE_DISTRIBUTOR_HPP
