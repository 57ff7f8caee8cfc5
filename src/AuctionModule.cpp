#include "AuctionModule.hpp"
#include "AddressManager.hpp"
#include "ParamsCodec.hpp"
#include <iostream>

namespace auction {

    // ============================================================
    //  GUARDIA DE LLAMADA: mutex del módulo + detección de reentrada
    // ============================================================
    class AuctionModule::CallGuard {
        public:
            explicit CallGuard(AuctionModule& module) : lock(module.mutex), module(module) {
                if (module.inFlight) {
                    throw AuctionError(AuctionErrorCode::REENTRANT_CALL, "another operation is in progress");
                }
                module.inFlight = true;
            }

            ~CallGuard() {
                module.inFlight = false;
            }

            CallGuard(const CallGuard&) = delete;
            CallGuard& operator=(const CallGuard&) = delete;

        private:
            std::unique_lock<std::recursive_mutex> lock;
            AuctionModule& module;
    };

    namespace {
        ModuleConfig normalizedConfig(const ModuleConfig& config) {
            if (!config.isValid()) {
                throw std::invalid_argument("Invalid module configuration");
            }
            ModuleConfig normalized = config;
            normalized.hubAddress = AddressManager::normalizeAddress(config.hubAddress);
            normalized.moduleAddress = AddressManager::normalizeAddress(config.moduleAddress);
            normalized.collectableTemplate = AddressManager::normalizeAddress(config.collectableTemplate);
            return normalized;
        }
    }

    AuctionModule::AuctionModule(const ModuleConfig& config,
                                 CurrencyRegistry& currencies,
                                 const ProfileRegistry& profiles,
                                 const FollowGraph& followGraph,
                                 const Governance& governance,
                                 CollectableFactory& factory,
                                 const Clock& clock)
        : moduleConfig(normalizedConfig(config)),
          currencies(currencies),
          profiles(profiles),
          clock(clock),
          bidProcessor(registry, referrals, currencies, profiles, followGraph, clock, moduleConfig.moduleAddress),
          feeDistributor(registry, referrals, recipients, currencies, profiles, governance, clock,
                         moduleConfig.moduleAddress),
          issuer(factory, moduleConfig.collectableTemplate, clock) {}

    // ------------------------------------------------------------
    // VALIDACIONES
    // ------------------------------------------------------------
    void AuctionModule::requireHub(const Address& caller) const {
        if (!AddressManager::isValidAddress(caller) ||
            AddressManager::normalizeAddress(caller) != moduleConfig.hubAddress) {
            throw AuctionError(AuctionErrorCode::NOT_HUB, "caller '" + caller + "' is not the hub");
        }
    }

    void AuctionModule::validateInitParams(const AuctionKey& key, const InitParams& params) const {
        const AuctionErrorCode code = AuctionErrorCode::INIT_PARAMS_INVALID;

        if (key.creatorId == NO_PROFILE) {
            throw AuctionError(code, "creator profile is required");
        }
        if (registry.contains(key)) {
            throw AuctionError(code, "auction " + key.toString() + " already initialized");
        }
        if (params.duration == 0) {
            throw AuctionError(code, "duration must be positive");
        }
        if (params.minTimeAfterBid > params.duration) {
            throw AuctionError(code, "minTimeAfterBid exceeds duration");
        }
        if (params.referralFeeBps > BPS_MAX) {
            throw AuctionError(code, "referral fee exceeds " + std::to_string(BPS_MAX) + " bps");
        }
        if (params.tokenData.royaltyBps > BPS_MAX) {
            throw AuctionError(code, "royalty exceeds " + std::to_string(BPS_MAX) + " bps");
        }
        if (params.tokenData.name.size() > TOKEN_TEXT_SIZE || params.tokenData.symbol.size() > TOKEN_TEXT_SIZE) {
            throw AuctionError(code, "token name and symbol are limited to 32 bytes");
        }
        if (!currencies.isCurrencyRegistered(params.currency)) {
            throw AuctionError(code, "currency '" + params.currency + "' is not registered");
        }

        RecipientSplitValidator::validate(params.recipients);
    }

    void AuctionModule::requireEnded(const AuctionKey& key, const AuctionData& data) const {
        switch (auctionStateAt(data, clock.now())) {
            case AuctionState::NOT_STARTED:
                throw AuctionError(AuctionErrorCode::UNAVAILABLE_AUCTION, "auction " + key.toString() + " has no bids");
            case AuctionState::OPEN:
                throw AuctionError(AuctionErrorCode::ONGOING_AUCTION,
                                   "auction " + key.toString() + " ends at " + std::to_string(data.endTimestamp));
            case AuctionState::ENDED:
                break;
        }
    }

    // ------------------------------------------------------------
    // NOTIFICACIÓN
    // ------------------------------------------------------------
    template <typename Event, typename Handler>
    void AuctionModule::notify(const Event& event, Handler handler) {
        for (const auto& observer : observers) {
            try {
                (observer.get()->*handler)(event);
            } catch (const std::exception& e) {
                std::cerr << "Warning: Auction observer failed: " << e.what() << std::endl;
            }
        }
    }

    void AuctionModule::addObserver(std::shared_ptr<AuctionObserver> observer) {
        if (!observer) {
            return;
        }
        std::lock_guard<std::recursive_mutex> lock(mutex);
        observers.push_back(std::move(observer));
    }

    // ------------------------------------------------------------
    // INITIALIZE
    // ------------------------------------------------------------
    AuctionCreatedEvent AuctionModule::initializeLocked(ProfileId creatorId, ContentId contentId,
                                                        const Address& creatorOwnerAddress,
                                                        const InitParams& params) {
        const AuctionKey key{creatorId, contentId};

        if (!AddressManager::isValidAddress(creatorOwnerAddress) ||
            !AddressManager::isValidAddress(params.currency)) {
            throw AuctionError(AuctionErrorCode::INIT_PARAMS_INVALID, "invalid creator or currency address");
        }

        InitParams normalized = params;
        normalized.currency = AddressManager::normalizeAddress(params.currency);
        validateInitParams(key, normalized);

        AuctionData data;
        data.availableSinceTimestamp = normalized.availableSinceTimestamp;
        data.duration = normalized.duration;
        data.minTimeAfterBid = normalized.minTimeAfterBid;
        data.reservePrice = normalized.reservePrice;
        data.minBidIncrement = normalized.minBidIncrement;
        data.referralFeeBps = normalized.referralFeeBps;
        data.currency = normalized.currency;
        data.onlyFollowers = normalized.onlyFollowers;
        data.creatorOwnerAddress = AddressManager::normalizeAddress(creatorOwnerAddress);
        data.tokenData = normalized.tokenData;

        recipients.store(key, normalized.recipients);
        registry.create(key, data);

        AuctionCreatedEvent event;
        event.key = key;
        event.creatorOwnerAddress = data.creatorOwnerAddress;
        event.params = normalized;
        event.params.recipients = recipients.recipients(key);
        event.timestamp = clock.now();

        notify(event, &AuctionObserver::onAuctionCreated);
        return event;
    }

    AuctionCreatedEvent AuctionModule::initialize(const Address& caller, ProfileId creatorId, ContentId contentId,
                                                  const Address& creatorOwnerAddress, const InitParams& params) {
        CallGuard guard(*this);
        requireHub(caller);
        return initializeLocked(creatorId, contentId, creatorOwnerAddress, params);
    }

    std::vector<uint8_t> AuctionModule::initialize(const Address& caller, ProfileId creatorId, ContentId contentId,
                                                   const Address& creatorOwnerAddress,
                                                   const std::vector<uint8_t>& payload) {
        CallGuard guard(*this);
        requireHub(caller);
        initializeLocked(creatorId, contentId, creatorOwnerAddress, decodeInitParams(payload));
        return payload;
    }

    // ------------------------------------------------------------
    // BID
    // ------------------------------------------------------------
    BidPlacedEvent AuctionModule::bidLocked(const BidParams& params) {
        if (!AddressManager::isValidAddress(params.transactionExecutor) ||
            !AddressManager::isValidAddress(params.bidderOwnerAddress)) {
            throw AuctionError(AuctionErrorCode::INVALID_PAYLOAD, "invalid bidder or executor address");
        }

        BidParams normalized = params;
        normalized.transactionExecutor = AddressManager::normalizeAddress(params.transactionExecutor);
        normalized.bidderOwnerAddress = AddressManager::normalizeAddress(params.bidderOwnerAddress);

        BidPlacedEvent event = bidProcessor.placeBid(normalized);
        notify(event, &AuctionObserver::onBidPlaced);
        return event;
    }

    BidPlacedEvent AuctionModule::bid(const Address& caller, const BidParams& params) {
        CallGuard guard(*this);
        requireHub(caller);
        return bidLocked(params);
    }

    std::vector<uint8_t> AuctionModule::bid(const Address& caller, const BidParams& context,
                                            const std::vector<uint8_t>& payload) {
        CallGuard guard(*this);
        requireHub(caller);

        BidParams params = context;
        params.amount = decodeBidAmount(payload);
        bidLocked(params);
        return payload;
    }

    // ------------------------------------------------------------
    // CLAIM
    // ------------------------------------------------------------
    CollectedEvent AuctionModule::claim(ProfileId creatorId, ContentId contentId) {
        CallGuard guard(*this);
        const AuctionKey key{creatorId, contentId};
        const AuctionData data = registry.read(key);

        requireEnded(key, data);
        if (data.collected) {
            throw AuctionError(AuctionErrorCode::COLLECT_ALREADY_PROCESSED, key.toString());
        }

        // Dueño actual del perfil ganador, no el que pujó
        const Address winnerAddress = profiles.ownerOf(data.winnerId);

        // 1. Preparación: nada visible cambia si algo falla aquí
        std::optional<PreparedDistribution> distribution;
        if (!data.feeProcessed) {
            distribution = feeDistributor.prepare(key);
        }
        const PreparedCollectable collectable = issuer.prepare(key, data.tokenData);

        // 2. Mint antes de mover fondos; el reparto ya se comprobó contra la moneda
        const uint64_t tokenId = issuer.mint(collectable, winnerAddress);

        std::optional<FeeProcessedEvent> fee;
        if (distribution) {
            fee = feeDistributor.commit(*distribution);
        }

        // 3. Registro
        std::optional<CollectableDeployedEvent> deployed = issuer.commit(collectable);
        registry.setFlags(key, AuctionFlags{true, std::nullopt});

        CollectedEvent event;
        event.key = key;
        event.winnerId = data.winnerId;
        event.winnerAddress = winnerAddress;
        event.collectable = collectable.token->address();
        event.tokenId = tokenId;
        event.timestamp = clock.now();

        if (deployed) {
            notify(*deployed, &AuctionObserver::onCollectableDeployed);
        }
        if (fee) {
            notify(*fee, &AuctionObserver::onFeeProcessed);
        }
        notify(event, &AuctionObserver::onCollected);
        return event;
    }

    // ------------------------------------------------------------
    // PROCESS FEE
    // ------------------------------------------------------------
    FeeProcessedEvent AuctionModule::processFee(ProfileId creatorId, ContentId contentId) {
        CallGuard guard(*this);
        const AuctionKey key{creatorId, contentId};

        requireEnded(key, registry.read(key));

        FeeProcessedEvent event = feeDistributor.distribute(key);
        notify(event, &AuctionObserver::onFeeProcessed);
        return event;
    }

    // ------------------------------------------------------------
    // CONSULTAS
    // ------------------------------------------------------------
    AuctionData AuctionModule::getAuctionData(ProfileId creatorId, ContentId contentId) const {
        std::lock_guard<std::recursive_mutex> lock(mutex);
        return registry.read(AuctionKey{creatorId, contentId});
    }

    std::vector<RecipientData> AuctionModule::getRecipients(ProfileId creatorId, ContentId contentId) const {
        std::lock_guard<std::recursive_mutex> lock(mutex);
        return recipients.recipients(AuctionKey{creatorId, contentId});
    }

    std::optional<Address> AuctionModule::getCollectable(ProfileId creatorId, ContentId contentId) const {
        std::lock_guard<std::recursive_mutex> lock(mutex);
        return issuer.collectableOf(AuctionKey{creatorId, contentId});
    }

    std::vector<ProfileId> AuctionModule::getReferrers(ProfileId creatorId, ContentId contentId,
                                                       ProfileId bidderId) const {
        std::lock_guard<std::recursive_mutex> lock(mutex);
        return referrals.referrersOf(AuctionKey{creatorId, contentId}, bidderId);
    }

    AuctionState AuctionModule::stateOf(ProfileId creatorId, ContentId contentId) const {
        std::lock_guard<std::recursive_mutex> lock(mutex);
        return auctionStateAt(registry.read(AuctionKey{creatorId, contentId}), clock.now());
    }

    std::vector<AuctionKey> AuctionModule::auctionKeys() const {
        std::lock_guard<std::recursive_mutex> lock(mutex);
        return registry.keys();
    }

    // ------------------------------------------------------------
    // PERSISTENCIA
    // ------------------------------------------------------------
    AuctionSnapshot AuctionModule::exportState() const {
        std::lock_guard<std::recursive_mutex> lock(mutex);

        AuctionSnapshot snapshot;
        snapshot.auctions = registry.all();
        snapshot.recipients = recipients.all();
        snapshot.referrals = referrals.all();
        snapshot.collectables = issuer.all();
        return snapshot;
    }

    void AuctionModule::importState(const AuctionSnapshot& snapshot) {
        CallGuard guard(*this);

        registry.restore(snapshot.auctions);
        recipients.restore(snapshot.recipients);
        referrals.restore(snapshot.referrals);
        issuer.restore(snapshot.collectables);
    }

} // namespace auction
