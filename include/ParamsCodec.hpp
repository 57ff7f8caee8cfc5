#ifndef COLLECT_AUCTION_PARAMS_CODEC_HPP
#define COLLECT_AUCTION_PARAMS_CODEC_HPP

#include "AuctionError.hpp"
#include "AuctionTypes.hpp"
#include <cstdint>
#include <vector>

namespace auction {

    // ============================================================
    //  PAYLOADS EN LA FRONTERA DEL MÓDULO
    // ============================================================
    //
    // Codificación ABI de palabras de 32 bytes big-endian, en este orden:
    //
    //   availableSinceTimestamp  uint64
    //   duration                 uint32
    //   minTimeAfterBid          uint32
    //   reservePrice             uint256
    //   minBidIncrement          uint256
    //   referralFee              uint16
    //   currency                 address
    //   recipients               tuple(address,uint16)[]   (offset -> cola)
    //   onlyFollowers            bool
    //   tokenName                bytes32
    //   tokenSymbol              bytes32
    //   tokenRoyalty             uint16
    //
    // El payload de puja es una única palabra uint256 con el importe.

    inline constexpr size_t INIT_HEAD_WORDS = 12;

    /** Serializa InitParams a bytes */
    std::vector<uint8_t> encodeInitParams(const InitParams& params);

    /** Parsea bytes a InitParams; lanza AuctionError(INIT_PARAMS_INVALID) si está mal formado */
    InitParams decodeInitParams(const std::vector<uint8_t>& payload);

    std::vector<uint8_t> encodeBidAmount(const Amount& amount);

    /** Lanza AuctionError(INVALID_PAYLOAD) si no es exactamente una palabra */
    Amount decodeBidAmount(const std::vector<uint8_t>& payload);

    /** bytes32 <-> texto (relleno con ceros a la derecha) */
    std::vector<uint8_t> encodeBytes32String(const std::string& text);
    std::string decodeBytes32String(const uint8_t* word);

} // namespace auction

#endif // COLLECT_AUCTION_PARAMS_CODEC_HPP
