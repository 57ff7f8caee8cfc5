#include "CollectNFT.hpp"
#include "AddressManager.hpp"
#include <stdexcept>

namespace auction {

    namespace {
        void appendUint64BE(std::vector<uint8_t>& buffer, uint64_t value) {
            for (int shift = 56; shift >= 0; shift -= 8) {
                buffer.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
            }
        }
    }

    // ------------------------------------------------------------
    // COLLECT NFT
    // ------------------------------------------------------------
    CollectNFT::CollectNFT(const Address& address, const ProfileRegistry& profiles)
        : tokenAddress(AddressManager::normalizeAddress(address)), profiles(profiles) {}

    void CollectNFT::initialize(const CollectableInitArgs& initArgs) {
        if (initialized) {
            throw std::logic_error("Collectable " + tokenAddress + " already initialized");
        }
        if (initArgs.royaltyBps > BPS_MAX) {
            throw std::invalid_argument("Royalty exceeds " + std::to_string(BPS_MAX) + " bps");
        }
        args = initArgs;
        initialized = true;
    }

    uint64_t CollectNFT::mint(const Address& to) {
        if (!initialized) {
            throw std::logic_error("Collectable " + tokenAddress + " not initialized");
        }
        const Address holder = AddressManager::normalizeAddress(to);
        if (AddressManager::isZeroAddress(holder)) {
            throw std::invalid_argument("Cannot mint to the zero address");
        }

        const uint64_t tokenId = ++lastTokenId;
        tokenOwners[tokenId] = holder;
        return tokenId;
    }

    Address CollectNFT::owner() const {
        return profiles.ownerOf(args.creatorId);
    }

    Address CollectNFT::ownerOf(uint64_t tokenId) const {
        auto it = tokenOwners.find(tokenId);
        if (it == tokenOwners.end()) {
            throw std::invalid_argument("Unknown token id " + std::to_string(tokenId));
        }
        return it->second;
    }

    uint64_t CollectNFT::balanceOf(const Address& holder) const {
        const Address normalized = AddressManager::normalizeAddress(holder);
        uint64_t balance = 0;
        for (const auto& [tokenId, tokenOwner] : tokenOwners) {
            if (tokenOwner == normalized) {
                ++balance;
            }
        }
        return balance;
    }

    std::pair<Address, Amount> CollectNFT::royaltyInfo(const Amount& salePrice) const {
        return {owner(), bpsOf(salePrice, args.royaltyBps)};
    }

    // ------------------------------------------------------------
    // FACTORY
    // ------------------------------------------------------------
    CollectNFTFactory::CollectNFTFactory(const ProfileRegistry& profiles) : profiles(profiles) {}

    Address CollectNFTFactory::predictAddress(const Address& templateAddress, ProfileId creatorId, ContentId contentId) {
        std::vector<uint8_t> seed = CryptoBase::hexDecode(AddressManager::normalizeAddress(templateAddress));
        appendUint64BE(seed, creatorId);
        appendUint64BE(seed, contentId);
        return AddressManager::getAddressFromBytes(seed);
    }

    std::shared_ptr<CollectableToken> CollectNFTFactory::instantiate(const Address& templateAddress,
                                                                      const CollectableInitArgs& args) {
        const Address cloneAddress = predictAddress(templateAddress, args.creatorId, args.contentId);
        if (clones.count(cloneAddress)) {
            throw std::runtime_error("Collectable clone already exists at " + cloneAddress);
        }

        auto clone = std::make_shared<CollectNFT>(cloneAddress, profiles);
        clone->initialize(args);
        clones[cloneAddress] = clone;
        return clone;
    }

    std::shared_ptr<CollectableToken> CollectNFTFactory::find(const Address& handle) const {
        return collectNFT(handle);
    }

    std::shared_ptr<CollectNFT> CollectNFTFactory::collectNFT(const Address& handle) const {
        if (!AddressManager::isValidAddress(handle)) {
            return nullptr;
        }
        auto it = clones.find(AddressManager::normalizeAddress(handle));
        return it == clones.end() ? nullptr : it->second;
    }

} // namespace auction
