#ifndef COLLECT_AUCTION_AUCTION_EVENTS_HPP
#define COLLECT_AUCTION_AUCTION_EVENTS_HPP

#include "AuctionTypes.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace auction {

    // ============================================================
    //  OBSERVACIONES EMITIDAS POR EL MÓDULO
    // ============================================================
    struct AuctionCreatedEvent {
        AuctionKey key;
        Address creatorOwnerAddress;
        InitParams params;
        Timestamp timestamp = 0;
    };

    struct BidPlacedEvent {
        AuctionKey key;
        std::vector<ProfileId> referrerIds;
        Amount amount = 0;
        Address transactionExecutor;
        ProfileId bidderId = NO_PROFILE;
        Address bidderOwnerAddress;
        Timestamp endTimestamp = 0;
        Timestamp timestamp = 0;
    };

    struct FeeProcessedEvent {
        AuctionKey key;
        Amount winningBid = 0;
        Amount treasuryAmount = 0;
        Amount referralAmount = 0;   // Total calculado para referidos
        Amount recipientsAmount = 0; // Total efectivamente pagado a destinatarios
        Timestamp timestamp = 0;
    };

    struct CollectableDeployedEvent {
        AuctionKey key;
        Address collectable;
        Timestamp timestamp = 0;
    };

    struct CollectedEvent {
        AuctionKey key;
        ProfileId winnerId = NO_PROFILE;
        Address winnerAddress;
        Address collectable;
        uint64_t tokenId = 0;
        Timestamp timestamp = 0;
    };

    /**
     * Receptor de observaciones. Todos los métodos tienen implementación
     * vacía para que cada observador sobreescriba solo lo que le interesa.
     */
    class AuctionObserver {
        public:
            virtual ~AuctionObserver() = default;

            virtual void onAuctionCreated(const AuctionCreatedEvent& event) { (void)event; }
            virtual void onBidPlaced(const BidPlacedEvent& event) { (void)event; }
            virtual void onFeeProcessed(const FeeProcessedEvent& event) { (void)event; }
            virtual void onCollectableDeployed(const CollectableDeployedEvent& event) { (void)event; }
            virtual void onCollected(const CollectedEvent& event) { (void)event; }
    };

    /** Escribe cada observación en un stream ("[AUCTION] ...") */
    class LoggingObserver : public AuctionObserver {
        public:
            explicit LoggingObserver(std::ostream& out = std::cout);

            void onAuctionCreated(const AuctionCreatedEvent& event) override;
            void onBidPlaced(const BidPlacedEvent& event) override;
            void onFeeProcessed(const FeeProcessedEvent& event) override;
            void onCollectableDeployed(const CollectableDeployedEvent& event) override;
            void onCollected(const CollectedEvent& event) override;

        private:
            std::ostream& out;
    };

} // namespace auction

#endif // COLLECT_AUCTION_AUCTION_EVENTS_HPP
