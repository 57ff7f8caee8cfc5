#ifndef COLLECT_AUCTION_AUCTION_TYPES_HPP
#define COLLECT_AUCTION_AUCTION_TYPES_HPP

#include "Types.hpp"
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace auction {

    // Importes de 256 bits; el desbordamiento lanza std::overflow_error
    using Amount = boost::multiprecision::checked_uint256_t;

    using ProfileId = uint64_t;
    using ContentId = uint64_t;
    using Timestamp = uint64_t;
    using Address = std::string; // 40 caracteres hex en minúsculas

    inline constexpr ProfileId NO_PROFILE = 0;  // Sin ganador todavía
    inline constexpr Timestamp NO_TIMESTAMP = 0; // Subasta sin empezar

    // ============================================================
    //  CLAVE DE PUBLICACIÓN
    // ============================================================
    struct AuctionKey {
        ProfileId creatorId = 0;
        ContentId contentId = 0;

        bool operator==(const AuctionKey& other) const {
            return creatorId == other.creatorId && contentId == other.contentId;
        }

        bool operator!=(const AuctionKey& other) const {
            return !(*this == other);
        }

        std::string toString() const {
            return std::to_string(creatorId) + "/" + std::to_string(contentId);
        }
    };

    struct AuctionKeyHash {
        size_t operator()(const AuctionKey& key) const {
            size_t h1 = std::hash<uint64_t>{}(key.creatorId);
            size_t h2 = std::hash<uint64_t>{}(key.contentId);
            return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
        }
    };

    // ============================================================
    //  DATOS DEL COLECCIONABLE Y DEL REPARTO
    // ============================================================
    struct TokenData {
        std::string name;      // bytes32 en el payload
        std::string symbol;    // bytes32 en el payload
        uint16_t royaltyBps = 0;
    };

    struct RecipientData {
        Address recipient;
        uint16_t splitBps = 0;
    };

    // ============================================================
    //  PARÁMETROS DE ENTRADA
    // ============================================================
    struct InitParams {
        Timestamp availableSinceTimestamp = 0;
        uint32_t duration = 0;
        uint32_t minTimeAfterBid = 0;
        Amount reservePrice = 0;
        Amount minBidIncrement = 0;
        uint16_t referralFeeBps = 0;
        Address currency;
        std::vector<RecipientData> recipients;
        bool onlyFollowers = false;
        TokenData tokenData;
    };

    struct BidParams {
        AuctionKey key;
        ProfileId bidderId = NO_PROFILE;
        Address bidderOwnerAddress;
        Address transactionExecutor;
        std::vector<ProfileId> referrerIds;
        Amount amount = 0;
    };

    // ============================================================
    //  ESTADO DE UNA SUBASTA
    // ============================================================
    struct AuctionData {
        Timestamp availableSinceTimestamp = 0;
        Timestamp startTimestamp = NO_TIMESTAMP;
        uint32_t duration = 0;
        uint32_t minTimeAfterBid = 0;
        Timestamp endTimestamp = NO_TIMESTAMP;
        Amount reservePrice = 0;
        Amount minBidIncrement = 0;
        uint16_t referralFeeBps = 0;
        Address currency;
        bool onlyFollowers = false;
        bool collected = false;
        bool feeProcessed = false;
        Amount winningBid = 0;
        ProfileId winnerId = NO_PROFILE;
        Address creatorOwnerAddress;
        TokenData tokenData;

        bool hasStarted() const { return startTimestamp != NO_TIMESTAMP; }
        bool hasWinner() const { return winnerId != NO_PROFILE; }
    };

    enum class AuctionState : uint8_t {
        NOT_STARTED = 0,
        OPEN        = 1,
        ENDED       = 2
    };

    /** Estado derivado del registro y del instante actual */
    AuctionState auctionStateAt(const AuctionData& data, Timestamp now);

    /** Convierte un AuctionState en string (útil para logs) */
    std::string auctionStateToString(AuctionState state);

    // ============================================================
    //  ARITMÉTICA DE IMPORTES
    // ============================================================

    /** floor(value * bps / 10000) */
    Amount bpsOf(const Amount& value, uint16_t bps);

    /** Representación decimal del importe */
    std::string amountToString(const Amount& value);

    /**
     * Parsea un importe decimal. Con decimals > 0 acepta parte fraccionaria
     * ("0.001" con 18 decimales = 10^15). Lanza std::invalid_argument.
     */
    Amount parseAmount(const std::string& text, unsigned decimals = 0);

    /** Palabra big-endian de 32 bytes */
    std::vector<uint8_t> amountToBytes(const Amount& value);
    Amount amountFromBytes(const uint8_t* data, size_t size);

} // namespace auction

#endif // COLLECT_AUCTION_AUCTION_TYPES_HPP
