#ifndef COLLECT_AUCTION_AUCTION_REGISTRY_HPP
#define COLLECT_AUCTION_AUCTION_REGISTRY_HPP

#include "AuctionTypes.hpp"
#include <optional>
#include <unordered_map>
#include <vector>

namespace auction {

    using AuctionTable = std::unordered_map<AuctionKey, AuctionData, AuctionKeyHash>;

    /** Flags de un solo sentido; std::nullopt deja el flag como está */
    struct AuctionFlags {
        std::optional<bool> collected;
        std::optional<bool> feeProcessed;
    };

    /**
     * Contenedor de estado por publicación. No aplica reglas de negocio:
     * los invariantes los garantizan los llamadores antes de mutar.
     */
    class AuctionRegistry {
        public:
            // ==== OPERACIONES BASICAS ====
            void create(const AuctionKey& key, const AuctionData& data);
            bool contains(const AuctionKey& key) const;

            /** Copia del registro; uno vacío (duration 0) si la clave no existe */
            AuctionData read(const AuctionKey& key) const;

            // ==== MUTACIONES ====
            void applyBid(const AuctionKey& key, const Amount& amount, ProfileId winnerId,
                          Timestamp startTimestamp, Timestamp endTimestamp);
            void setFlags(const AuctionKey& key, const AuctionFlags& flags);

            // ==== CONSULTA ====
            size_t size() const { return auctions.size(); }
            std::vector<AuctionKey> keys() const;

            const AuctionTable& all() const { return auctions; }
            void restore(const AuctionTable& snapshot);

        private:
            AuctionData& mutableRecord(const AuctionKey& key);

            AuctionTable auctions;
    };

} // namespace auction

#endif // COLLECT_AUCTION_AUCTION_REGISTRY_HPP
