#ifndef COLLECT_AUCTION_AUCTION_MODULE_HPP
#define COLLECT_AUCTION_AUCTION_MODULE_HPP

#include "AuctionError.hpp"
#include "AuctionEvents.hpp"
#include "AuctionRegistry.hpp"
#include "AuctionSnapshot.hpp"
#include "BidProcessor.hpp"
#include "Collaborators.hpp"
#include "CollectableIssuer.hpp"
#include "FeeDistributor.hpp"
#include "ModuleConfig.hpp"
#include "RecipientSplitValidator.hpp"
#include "ReferralTracker.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace auction {

    /**
     * Fachada del módulo de subastas. Es la única superficie que usan los
     * llamadores externos.
     *
     * - initialize y bid solo los puede invocar el hub configurado.
     * - claim y processFee son públicos.
     * - Cada operación que modifica estado se serializa con un mutex del
     *   módulo; una llamada reentrante durante otra en curso lanza ReentrantCall.
     */
    class AuctionModule {
        public:
            AuctionModule(const ModuleConfig& config,
                          CurrencyRegistry& currencies,
                          const ProfileRegistry& profiles,
                          const FollowGraph& followGraph,
                          const Governance& governance,
                          CollectableFactory& factory,
                          const Clock& clock);

            AuctionModule(const AuctionModule&) = delete;
            AuctionModule& operator=(const AuctionModule&) = delete;

            // ==== OPERACIONES DEL HUB ====
            AuctionCreatedEvent initialize(const Address& caller, ProfileId creatorId, ContentId contentId,
                                           const Address& creatorOwnerAddress, const InitParams& params);

            /** Decodifica el payload de init y lo devuelve sin cambios */
            std::vector<uint8_t> initialize(const Address& caller, ProfileId creatorId, ContentId contentId,
                                            const Address& creatorOwnerAddress, const std::vector<uint8_t>& payload);

            BidPlacedEvent bid(const Address& caller, const BidParams& params);

            /** El importe se toma del payload (se ignora context.amount); devuelve el payload */
            std::vector<uint8_t> bid(const Address& caller, const BidParams& context,
                                     const std::vector<uint8_t>& payload);

            // ==== OPERACIONES PÚBLICAS ====
            CollectedEvent claim(ProfileId creatorId, ContentId contentId);
            FeeProcessedEvent processFee(ProfileId creatorId, ContentId contentId);

            // ==== CONSULTAS ====
            AuctionData getAuctionData(ProfileId creatorId, ContentId contentId) const;
            std::vector<RecipientData> getRecipients(ProfileId creatorId, ContentId contentId) const;
            std::optional<Address> getCollectable(ProfileId creatorId, ContentId contentId) const;
            std::vector<ProfileId> getReferrers(ProfileId creatorId, ContentId contentId, ProfileId bidderId) const;
            AuctionState stateOf(ProfileId creatorId, ContentId contentId) const;
            std::vector<AuctionKey> auctionKeys() const;

            // ==== OBSERVADORES ====
            void addObserver(std::shared_ptr<AuctionObserver> observer);

            // ==== PERSISTENCIA ====
            AuctionSnapshot exportState() const;
            void importState(const AuctionSnapshot& snapshot);

            const ModuleConfig& config() const { return moduleConfig; }

        private:
            class CallGuard;

            void requireHub(const Address& caller) const;
            void validateInitParams(const AuctionKey& key, const InitParams& params) const;
            void requireEnded(const AuctionKey& key, const AuctionData& data) const;

            AuctionCreatedEvent initializeLocked(ProfileId creatorId, ContentId contentId,
                                                 const Address& creatorOwnerAddress, const InitParams& params);
            BidPlacedEvent bidLocked(const BidParams& params);

            template <typename Event, typename Handler>
            void notify(const Event& event, Handler handler);

            ModuleConfig moduleConfig;
            CurrencyRegistry& currencies;
            const ProfileRegistry& profiles;
            const Clock& clock;

            AuctionRegistry registry;
            RecipientSplitValidator recipients;
            ReferralTracker referrals;
            BidProcessor bidProcessor;
            FeeDistributor feeDistributor;
            CollectableIssuer issuer;

            mutable std::recursive_mutex mutex;
            bool inFlight = false;
            std::vector<std::shared_ptr<AuctionObserver>> observers;
    };

} // namespace auction

#endif // COLLECT_AUCTION_AUCTION_MODULE_HPP
