#ifndef COLLECT_AUCTION_RECIPIENT_SPLIT_VALIDATOR_HPP
#define COLLECT_AUCTION_RECIPIENT_SPLIT_VALIDATOR_HPP

#include "AuctionTypes.hpp"
#include "AuctionError.hpp"
#include <unordered_map>
#include <vector>

namespace auction {

    using RecipientTable = std::unordered_map<AuctionKey, std::vector<RecipientData>, AuctionKeyHash>;

    class RecipientSplitValidator {
        public:
            /**
             * Valida entre 1 y MAX_RECIPIENTS destinatarios con direcciones válidas,
             * todos con splitBps > 0 y sumando exactamente BPS_MAX.
             * Lanza AuctionError con el código de la primera regla violada.
             */
            static void validate(const std::vector<RecipientData>& recipients);

            /** Valida y guarda la lista; inmutable a partir de aquí */
            void store(const AuctionKey& key, const std::vector<RecipientData>& recipients);

            /** Lista guardada, vacía si la clave no existe */
            const std::vector<RecipientData>& recipients(const AuctionKey& key) const;

            const RecipientTable& all() const { return table; }
            void restore(const RecipientTable& snapshot);

        private:
            RecipientTable table;
    };

} // namespace auction

#endif // COLLECT_AUCTION_RECIPIENT_SPLIT_VALIDATOR_HPP
