#ifndef COLLECT_AUCTION_COLLECTABLE_ISSUER_HPP
#define COLLECT_AUCTION_COLLECTABLE_ISSUER_HPP

#include "AuctionEvents.hpp"
#include "Collaborators.hpp"
#include <memory>
#include <optional>
#include <unordered_map>

namespace auction {

    using CollectableTable = std::unordered_map<AuctionKey, Address, AuctionKeyHash>;

    /** Clon listo para acuñar; el handle aún no está registrado */
    struct PreparedCollectable {
        AuctionKey key;
        std::shared_ptr<CollectableToken> token;
        bool newlyDeployed = false; // despliegue todavía no anunciado
    };

    /**
     * Un coleccionable por publicación, clonado de la plantilla en el primer
     * claim. El handle se registra solo en commit(); un clon instanciado por
     * un claim fallido queda pendiente y se reutiliza en el siguiente intento.
     */
    class CollectableIssuer {
        public:
            CollectableIssuer(CollectableFactory& factory, const Address& templateAddress, const Clock& clock);

            /** Resuelve el clon registrado o pendiente, o lo instancia */
            PreparedCollectable prepare(const AuctionKey& key, const TokenData& tokenData);

            /** Acuña una unidad al destinatario en el clon preparado */
            uint64_t mint(const PreparedCollectable& prepared, const Address& to);

            /**
             * Registra el handle. Devuelve el evento de despliegue solo la
             * primera vez que se registra ese clon.
             */
            std::optional<CollectableDeployedEvent> commit(const PreparedCollectable& prepared);

            /** Handle registrado o std::nullopt */
            std::optional<Address> collectableOf(const AuctionKey& key) const;

            const CollectableTable& all() const { return table; }
            void restore(const CollectableTable& snapshot);

        private:
            using PendingTable = std::unordered_map<AuctionKey, std::shared_ptr<CollectableToken>, AuctionKeyHash>;

            CollectableFactory& factory;
            Address templateAddress;
            const Clock& clock;
            CollectableTable table;
            PendingTable pending;
    };

} // namespace auction

#endif // COLLECT_AUCTION_COLLECTABLE_ISSUER_HPP
