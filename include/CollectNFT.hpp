#ifndef COLLECT_AUCTION_COLLECT_NFT_HPP
#define COLLECT_AUCTION_COLLECT_NFT_HPP

#include "Collaborators.hpp"
#include <map>
#include <memory>
#include <utility>

namespace auction {

    /**
     * Coleccionable de una publicación. Se inicializa una sola vez; los
     * token ids empiezan en 1. El dueño y receptor de royalties es el dueño
     * actual del perfil creador.
     */
    class CollectNFT : public CollectableToken {
        public:
            CollectNFT(const Address& address, const ProfileRegistry& profiles);

            Address address() const override { return tokenAddress; }
            void initialize(const CollectableInitArgs& args) override;
            uint64_t mint(const Address& to) override;

            bool isInitialized() const { return initialized; }
            const std::string& name() const { return args.name; }
            const std::string& symbol() const { return args.symbol; }
            uint16_t royaltyBps() const { return args.royaltyBps; }
            ProfileId creatorId() const { return args.creatorId; }
            ContentId contentId() const { return args.contentId; }

            Address owner() const;
            Address ownerOf(uint64_t tokenId) const;
            uint64_t balanceOf(const Address& holder) const;
            uint64_t totalSupply() const { return lastTokenId; }

            /** Receptor y cantidad de royalty para un precio de venta */
            std::pair<Address, Amount> royaltyInfo(const Amount& salePrice) const;

        private:
            Address tokenAddress;
            const ProfileRegistry& profiles;
            CollectableInitArgs args;
            bool initialized = false;
            uint64_t lastTokenId = 0;
            std::map<uint64_t, Address> tokenOwners;
    };

    /**
     * Clona la plantilla con dirección determinista:
     * últimos 20 bytes de sha256(template | creatorId | contentId).
     */
    class CollectNFTFactory : public CollectableFactory {
        public:
            explicit CollectNFTFactory(const ProfileRegistry& profiles);

            std::shared_ptr<CollectableToken> instantiate(const Address& templateAddress,
                                                          const CollectableInitArgs& args) override;
            std::shared_ptr<CollectableToken> find(const Address& handle) const override;

            /** Acceso al tipo concreto (consultas de ownerOf, royalties...) */
            std::shared_ptr<CollectNFT> collectNFT(const Address& handle) const;

            static Address predictAddress(const Address& templateAddress, ProfileId creatorId, ContentId contentId);

            size_t count() const { return clones.size(); }

        private:
            const ProfileRegistry& profiles;
            std::map<Address, std::shared_ptr<CollectNFT>> clones;
    };

} // namespace auction

#endif // COLLECT_AUCTION_COLLECT_NFT_HPP
