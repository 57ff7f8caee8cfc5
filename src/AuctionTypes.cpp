#include "AuctionTypes.hpp"
#include <cctype>
#include <stdexcept>

namespace auction {

    AuctionState auctionStateAt(const AuctionData& data, Timestamp now) {
        if (!data.hasStarted()) {
            return AuctionState::NOT_STARTED;
        }
        if (now > data.endTimestamp) {
            return AuctionState::ENDED;
        }
        return AuctionState::OPEN;
    }

    std::string auctionStateToString(AuctionState state) {
        switch (state) {
            case AuctionState::NOT_STARTED: return "NotStarted";
            case AuctionState::OPEN:        return "Open";
            case AuctionState::ENDED:       return "Ended";
            default:                        return "Unknown";
        }
    }

    Amount bpsOf(const Amount& value, uint16_t bps) {
        return value * bps / BPS_MAX;
    }

    std::string amountToString(const Amount& value) {
        return value.str();
    }

    Amount parseAmount(const std::string& text, unsigned decimals) {
        if (text.empty()) {
            throw std::invalid_argument("Empty amount");
        }

        const size_t dot = text.find('.');
        std::string integerPart = text.substr(0, dot);
        std::string fractionPart = dot == std::string::npos ? "" : text.substr(dot + 1);

        if (integerPart.empty() && fractionPart.empty()) {
            throw std::invalid_argument("Invalid amount: " + text);
        }
        if (fractionPart.size() > decimals) {
            throw std::invalid_argument("Too many decimal places in amount: " + text);
        }

        fractionPart.append(decimals - fractionPart.size(), '0');
        const std::string digits = integerPart + fractionPart;

        Amount result = 0;
        for (char c : digits) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw std::invalid_argument("Invalid amount character in: " + text);
            }
            try {
                result = result * 10 + static_cast<unsigned>(c - '0');
            } catch (const std::overflow_error&) {
                throw std::invalid_argument("Amount exceeds 256 bits: " + text);
            }
        }
        return result;
    }

    std::vector<uint8_t> amountToBytes(const Amount& value) {
        std::vector<uint8_t> bytes(ABI_WORD_SIZE, 0);
        Amount remaining = value;
        for (size_t i = 0; i < ABI_WORD_SIZE; ++i) {
            const Amount low = remaining & 0xFF;
            bytes[ABI_WORD_SIZE - 1 - i] = low.convert_to<uint8_t>();
            remaining >>= 8;
        }
        return bytes;
    }

    Amount amountFromBytes(const uint8_t* data, size_t size) {
        if (size > ABI_WORD_SIZE) {
            throw std::invalid_argument("Amount word larger than 32 bytes");
        }
        Amount result = 0;
        for (size_t i = 0; i < size; ++i) {
            result <<= 8;
            result |= data[i];
        }
        return result;
    }

} // namespace auction
