#include "AddressManager.hpp"
#include <algorithm>
#include <cctype>

const std::string& AddressManager::zeroAddress() {
    static const std::string zero(ADDRESS_HEX_LENGTH, '0');
    return zero;
}

std::string AddressManager::getAddressFromBytes(const std::vector<uint8_t>& seed) {
    if (seed.empty()) {
        throw std::invalid_argument("Cannot derive address from empty seed");
    }
    
    // Calcular SHA-256 de la semilla
    std::vector<uint8_t> hash = CryptoBase::sha256Bytes(seed);
    
    if (hash.size() < ADDRESS_SIZE) {
        throw std::runtime_error("SHA-256 hash too short for address derivation");
    }
    
    // Tomar los últimos 20 bytes para la dirección (estilo Ethereum)
    std::vector<uint8_t> addressBytes(hash.end() - ADDRESS_SIZE, hash.end());
    std::string address = CryptoBase::hexEncode(addressBytes);
    
    if (!isValidAddress(address)) {
        throw std::runtime_error("Generated address is invalid");
    }
    
    return address;
}

bool AddressManager::isValidAddress(const std::string& address) {
    return validateAddressFormat(address);
}

bool AddressManager::isZeroAddress(const std::string& address) {
    return address == zeroAddress();
}

std::string AddressManager::normalizeAddress(const std::string& address) {
    std::string candidate = address;
    if (candidate.size() == ADDRESS_HEX_LENGTH + 2 && candidate[0] == '0' &&
        (candidate[1] == 'x' || candidate[1] == 'X')) {
        candidate = candidate.substr(2);
    }

    if (!isValidAddress(candidate)) {
        throw std::invalid_argument("Cannot normalize invalid address: " + address);
    }
    
    // Convertir a minúsculas para consistencia
    std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                  [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    
    return candidate;
}

bool AddressManager::validateAddressFormat(const std::string& address) {
    // 40 caracteres hexadecimales (20 bytes)
    if (address.length() != ADDRESS_HEX_LENGTH) {
        return false;
    }
    
    for (char c : address) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    
    return true;
}
