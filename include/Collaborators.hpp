#ifndef COLLECT_AUCTION_COLLABORATORS_HPP
#define COLLECT_AUCTION_COLLABORATORS_HPP

#include "AuctionTypes.hpp"
#include <memory>
#include <string>
#include <vector>

namespace auction {

    // ============================================================
    //  MONEDA FUNGIBLE (estilo ERC20)
    // ============================================================

    /** Un movimiento de fondos dentro de una liquidación */
    struct TransferLeg {
        Address from;
        Address to;
        Amount amount = 0;
    };

    class Currency {
        public:
            virtual ~Currency() = default;

            virtual Amount balanceOf(const Address& owner) const = 0;
            virtual Amount allowance(const Address& owner, const Address& spender) const = 0;

            /**
             * Aplica los movimientos en orden y de forma atómica: o se aplican
             * todos o ninguno. Un movimiento con from == spender es una
             * transferencia directa; cualquier otro consume allowance(from, spender).
             * Lanza std::runtime_error si algún movimiento falla.
             */
            virtual void settle(const Address& spender, const std::vector<TransferLeg>& legs) = 0;

            /** Comprueba settle sin aplicarlo; lanza lo mismo que lanzaría settle */
            virtual void checkSettle(const Address& spender, const std::vector<TransferLeg>& legs) const = 0;
    };

    class CurrencyRegistry {
        public:
            virtual ~CurrencyRegistry() = default;

            virtual bool isCurrencyRegistered(const Address& currency) const = 0;

            /** Lanza std::invalid_argument si la moneda no está registrada */
            virtual Currency& currency(const Address& currency) = 0;
    };

    // ============================================================
    //  PERFILES Y GRAFO DE SEGUIDORES
    // ============================================================
    class ProfileRegistry {
        public:
            virtual ~ProfileRegistry() = default;

            virtual bool exists(ProfileId profileId) const = 0;

            /** Dueño actual del perfil; lanza std::invalid_argument si no existe */
            virtual Address ownerOf(ProfileId profileId) const = 0;
    };

    class FollowGraph {
        public:
            virtual ~FollowGraph() = default;

            virtual bool isFollowing(ProfileId followerId, ProfileId followedId) const = 0;
    };

    // ============================================================
    //  GOBERNANZA
    // ============================================================
    struct TreasuryData {
        Address treasury;
        uint16_t treasuryFeeBps = 0;
    };

    class Governance {
        public:
            virtual ~Governance() = default;

            virtual TreasuryData getTreasuryData() const = 0;
    };

    // ============================================================
    //  COLECCIONABLE
    // ============================================================
    struct CollectableInitArgs {
        ProfileId creatorId = 0;
        ContentId contentId = 0;
        std::string name;
        std::string symbol;
        uint16_t royaltyBps = 0;
    };

    class CollectableToken {
        public:
            virtual ~CollectableToken() = default;

            virtual Address address() const = 0;
            virtual void initialize(const CollectableInitArgs& args) = 0;
            virtual uint64_t mint(const Address& to) = 0;
    };

    class CollectableFactory {
        public:
            virtual ~CollectableFactory() = default;

            /** Crea un clon de la plantilla ya inicializado */
            virtual std::shared_ptr<CollectableToken> instantiate(const Address& templateAddress,
                                                                  const CollectableInitArgs& args) = 0;

            /** Resuelve un clon creado antes; nullptr si no existe */
            virtual std::shared_ptr<CollectableToken> find(const Address& handle) const = 0;
    };

    // ============================================================
    //  RELOJ
    // ============================================================
    class Clock {
        public:
            virtual ~Clock() = default;

            virtual Timestamp now() const = 0;
    };

} // namespace auction

#endif // COLLECT_AUCTION_COLLABORATORS_HPP
