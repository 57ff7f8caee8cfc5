#include "CollectableIssuer.hpp"
#include <stdexcept>

namespace auction {

    CollectableIssuer::CollectableIssuer(CollectableFactory& factory, const Address& templateAddress, const Clock& clock)
        : factory(factory), templateAddress(templateAddress), clock(clock) {}

    PreparedCollectable CollectableIssuer::prepare(const AuctionKey& key, const TokenData& tokenData) {
        PreparedCollectable prepared;
        prepared.key = key;

        auto registered = table.find(key);
        if (registered != table.end()) {
            prepared.token = factory.find(registered->second);
            if (!prepared.token) {
                throw std::runtime_error("Collectable " + registered->second + " cannot be resolved");
            }
            return prepared;
        }

        prepared.newlyDeployed = true;

        auto waiting = pending.find(key);
        if (waiting != pending.end()) {
            prepared.token = waiting->second;
            return prepared;
        }

        CollectableInitArgs args;
        args.creatorId = key.creatorId;
        args.contentId = key.contentId;
        args.name = tokenData.name;
        args.symbol = tokenData.symbol;
        args.royaltyBps = tokenData.royaltyBps;

        prepared.token = factory.instantiate(templateAddress, args);
        if (!prepared.token) {
            throw std::runtime_error("Collectable factory returned no instance for " + key.toString());
        }

        pending[key] = prepared.token;
        return prepared;
    }

    uint64_t CollectableIssuer::mint(const PreparedCollectable& prepared, const Address& to) {
        if (!prepared.token) {
            throw std::logic_error("Collectable not prepared for " + prepared.key.toString());
        }
        return prepared.token->mint(to);
    }

    std::optional<CollectableDeployedEvent> CollectableIssuer::commit(const PreparedCollectable& prepared) {
        if (!prepared.token) {
            throw std::logic_error("Collectable not prepared for " + prepared.key.toString());
        }

        table[prepared.key] = prepared.token->address();
        pending.erase(prepared.key);

        if (!prepared.newlyDeployed) {
            return std::nullopt;
        }

        CollectableDeployedEvent event;
        event.key = prepared.key;
        event.collectable = prepared.token->address();
        event.timestamp = clock.now();
        return event;
    }

    std::optional<Address> CollectableIssuer::collectableOf(const AuctionKey& key) const {
        auto it = table.find(key);
        if (it == table.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void CollectableIssuer::restore(const CollectableTable& snapshot) {
        table = snapshot;
    }

} // namespace auction
