#include "ParamsCodec.hpp"
#include "AddressManager.hpp"
#include "CryptoBase.hpp"
#include <cstring>

namespace auction {

    namespace {

        // ------------------------------------------------------------
        // ESCRITURA DE PALABRAS
        // ------------------------------------------------------------
        void appendWord(std::vector<uint8_t>& buffer, const std::vector<uint8_t>& word) {
            buffer.insert(buffer.end(), word.begin(), word.end());
        }

        void appendUint(std::vector<uint8_t>& buffer, uint64_t value) {
            appendWord(buffer, amountToBytes(Amount(value)));
        }

        void appendAddress(std::vector<uint8_t>& buffer, const Address& address) {
            std::vector<uint8_t> raw = CryptoBase::hexDecode(AddressManager::normalizeAddress(address));
            std::vector<uint8_t> word(ABI_WORD_SIZE - ADDRESS_SIZE, 0);
            word.insert(word.end(), raw.begin(), raw.end());
            appendWord(buffer, word);
        }

        // ------------------------------------------------------------
        // LECTURA DE PALABRAS
        // ------------------------------------------------------------
        class WordReader {
            public:
                WordReader(const std::vector<uint8_t>& buffer, AuctionErrorCode errorCode)
                    : buffer(buffer), errorCode(errorCode) {}

                const uint8_t* wordAt(size_t offset) const {
                    if (offset % ABI_WORD_SIZE != 0 || offset + ABI_WORD_SIZE > buffer.size()) {
                        throw AuctionError(errorCode, "payload truncated at offset " + std::to_string(offset));
                    }
                    return buffer.data() + offset;
                }

                Amount readAmount(size_t offset) const {
                    return amountFromBytes(wordAt(offset), ABI_WORD_SIZE);
                }

                // Entero sin signo de 'bits' bits; los bytes altos deben ser cero
                uint64_t readUint(size_t offset, unsigned bits) const {
                    const Amount value = readAmount(offset);
                    const Amount limit = Amount(1) << bits;
                    if (value >= limit) {
                        throw AuctionError(errorCode, "uint" + std::to_string(bits) + " out of range at offset " +
                                                      std::to_string(offset));
                    }
                    return value.convert_to<uint64_t>();
                }

                bool readBool(size_t offset) const {
                    const uint64_t value = readUint(offset, 8);
                    if (value > 1) {
                        throw AuctionError(errorCode, "invalid bool at offset " + std::to_string(offset));
                    }
                    return value == 1;
                }

                Address readAddress(size_t offset) const {
                    const uint8_t* word = wordAt(offset);
                    for (size_t i = 0; i < ABI_WORD_SIZE - ADDRESS_SIZE; ++i) {
                        if (word[i] != 0) {
                            throw AuctionError(errorCode, "dirty address padding at offset " + std::to_string(offset));
                        }
                    }
                    std::vector<uint8_t> raw(word + ABI_WORD_SIZE - ADDRESS_SIZE, word + ABI_WORD_SIZE);
                    return CryptoBase::hexEncode(raw);
                }

                size_t size() const { return buffer.size(); }

            private:
                const std::vector<uint8_t>& buffer;
                AuctionErrorCode errorCode;
        };
    }

    // ------------------------------------------------------------
    // BYTES32
    // ------------------------------------------------------------
    std::vector<uint8_t> encodeBytes32String(const std::string& text) {
        if (text.size() > TOKEN_TEXT_SIZE) {
            throw std::invalid_argument("String longer than 32 bytes: " + text);
        }
        std::vector<uint8_t> word(ABI_WORD_SIZE, 0);
        std::memcpy(word.data(), text.data(), text.size());
        return word;
    }

    std::string decodeBytes32String(const uint8_t* word) {
        size_t length = 0;
        while (length < TOKEN_TEXT_SIZE && word[length] != 0) {
            ++length;
        }
        return std::string(reinterpret_cast<const char*>(word), length);
    }

    // ------------------------------------------------------------
    // INIT
    // ------------------------------------------------------------
    std::vector<uint8_t> encodeInitParams(const InitParams& params) {
        std::vector<uint8_t> buffer;
        buffer.reserve((INIT_HEAD_WORDS + 1 + params.recipients.size() * 2) * ABI_WORD_SIZE);

        appendUint(buffer, params.availableSinceTimestamp);
        appendUint(buffer, params.duration);
        appendUint(buffer, params.minTimeAfterBid);
        appendWord(buffer, amountToBytes(params.reservePrice));
        appendWord(buffer, amountToBytes(params.minBidIncrement));
        appendUint(buffer, params.referralFeeBps);
        appendAddress(buffer, params.currency);
        appendUint(buffer, INIT_HEAD_WORDS * ABI_WORD_SIZE); // offset de recipients
        appendUint(buffer, params.onlyFollowers ? 1 : 0);
        appendWord(buffer, encodeBytes32String(params.tokenData.name));
        appendWord(buffer, encodeBytes32String(params.tokenData.symbol));
        appendUint(buffer, params.tokenData.royaltyBps);

        // Cola dinámica: longitud + (address, uint16) por destinatario
        appendUint(buffer, params.recipients.size());
        for (const auto& recipient : params.recipients) {
            appendAddress(buffer, recipient.recipient);
            appendUint(buffer, recipient.splitBps);
        }

        return buffer;
    }

    InitParams decodeInitParams(const std::vector<uint8_t>& payload) {
        const AuctionErrorCode code = AuctionErrorCode::INIT_PARAMS_INVALID;

        if (payload.size() > MAX_PAYLOAD_SIZE) {
            throw AuctionError(code, "payload too large");
        }
        if (payload.size() < (INIT_HEAD_WORDS + 1) * ABI_WORD_SIZE) {
            throw AuctionError(code, "payload too short");
        }

        WordReader reader(payload, code);
        InitParams params;
        size_t position = 0;

        params.availableSinceTimestamp = reader.readUint(position, 64); position += ABI_WORD_SIZE;
        params.duration = static_cast<uint32_t>(reader.readUint(position, 32)); position += ABI_WORD_SIZE;
        params.minTimeAfterBid = static_cast<uint32_t>(reader.readUint(position, 32)); position += ABI_WORD_SIZE;
        params.reservePrice = reader.readAmount(position); position += ABI_WORD_SIZE;
        params.minBidIncrement = reader.readAmount(position); position += ABI_WORD_SIZE;
        params.referralFeeBps = static_cast<uint16_t>(reader.readUint(position, 16)); position += ABI_WORD_SIZE;
        params.currency = reader.readAddress(position); position += ABI_WORD_SIZE;
        const uint64_t recipientsOffset = reader.readUint(position, 32); position += ABI_WORD_SIZE;
        params.onlyFollowers = reader.readBool(position); position += ABI_WORD_SIZE;
        params.tokenData.name = decodeBytes32String(reader.wordAt(position)); position += ABI_WORD_SIZE;
        params.tokenData.symbol = decodeBytes32String(reader.wordAt(position)); position += ABI_WORD_SIZE;
        params.tokenData.royaltyBps = static_cast<uint16_t>(reader.readUint(position, 16));

        // Cola de recipients
        const uint64_t count = reader.readUint(recipientsOffset, 32);
        const uint64_t tailEnd = recipientsOffset + ABI_WORD_SIZE + count * 2 * ABI_WORD_SIZE;
        if (tailEnd > payload.size()) {
            throw AuctionError(code, "recipients array exceeds payload");
        }

        params.recipients.reserve(count);
        size_t cursor = recipientsOffset + ABI_WORD_SIZE;
        for (uint64_t i = 0; i < count; ++i) {
            RecipientData recipient;
            recipient.recipient = reader.readAddress(cursor); cursor += ABI_WORD_SIZE;
            recipient.splitBps = static_cast<uint16_t>(reader.readUint(cursor, 16)); cursor += ABI_WORD_SIZE;
            params.recipients.push_back(recipient);
        }

        return params;
    }

    // ------------------------------------------------------------
    // BID
    // ------------------------------------------------------------
    std::vector<uint8_t> encodeBidAmount(const Amount& amount) {
        return amountToBytes(amount);
    }

    Amount decodeBidAmount(const std::vector<uint8_t>& payload) {
        if (payload.size() != ABI_WORD_SIZE) {
            throw AuctionError(AuctionErrorCode::INVALID_PAYLOAD,
                               "bid payload must be one 32-byte word, got " + std::to_string(payload.size()));
        }
        return amountFromBytes(payload.data(), payload.size());
    }

} // namespace auction
