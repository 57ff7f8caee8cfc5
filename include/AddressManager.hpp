#ifndef COLLECT_AUCTION_ADDRESS_MANAGER_H
#define COLLECT_AUCTION_ADDRESS_MANAGER_H

#include "CryptoBase.hpp"
#include "Types.hpp"
#include <string>
#include <vector>
#include <cstdint>

class AddressManager {
public:
    // Dirección nula (40 ceros)
    static const std::string& zeroAddress();

    // Derivación determinista de direcciones desde bytes arbitrarios
    static std::string getAddressFromBytes(const std::vector<uint8_t>& seed);
    
    // Validación
    static bool isValidAddress(const std::string& address);
    static bool isZeroAddress(const std::string& address);
    
    // Utilidades
    static std::string normalizeAddress(const std::string& address);

private:
    static bool validateAddressFormat(const std::string& address);
};

#endif // COLLECT_AUCTION_ADDRESS_MANAGER_H
