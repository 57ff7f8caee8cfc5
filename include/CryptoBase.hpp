#ifndef COLLECT_AUCTION_CRYPTO_BASE_H
#define COLLECT_AUCTION_CRYPTO_BASE_H

#include <vector>
#include <string>
#include <cstdint>
#include <sodium.h>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <iostream>
#include "Types.hpp"

class CryptoBase {
public:
    // Inicialización (una sola vez al inicio)
    static bool initialize();
    
    // Hashing con libsodium
    static std::string sha256(const std::string& data);
    static std::string sha256(const std::vector<uint8_t>& data);
    static std::vector<uint8_t> sha256Bytes(const std::vector<uint8_t>& data);
    
    // Codificación/Decodificación
    static std::string hexEncode(const std::vector<uint8_t>& data);
    static std::vector<uint8_t> hexDecode(const std::string& hexStr);
};

#endif // COLLECT_AUCTION_CRYPTO_BASE_H
