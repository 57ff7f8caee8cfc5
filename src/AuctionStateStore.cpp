#include "AuctionStateStore.hpp"
#include <algorithm>
#include <sstream>

namespace fs = std::filesystem;

namespace auction {

    namespace {
        constexpr uint32_t MAX_SNAPSHOT_ENTRIES = 1000000;

        template<typename Table>
        std::vector<AuctionKey> sortedKeys(const Table& table) {
            std::vector<AuctionKey> keys;
            keys.reserve(table.size());
            for (const auto& entry : table) {
                keys.push_back(entry.first);
            }
            std::sort(keys.begin(), keys.end(), [](const AuctionKey& a, const AuctionKey& b) {
                return a.creatorId != b.creatorId ? a.creatorId < b.creatorId : a.contentId < b.contentId;
            });
            return keys;
        }
    }

    AuctionStateStore::AuctionStateStore(const std::string& dataDirectory) : dataDir(dataDirectory) {
        snapshotFile = dataDir + "/auctions.bin";
    }

    bool AuctionStateStore::initialize() {
        std::lock_guard<std::recursive_mutex> lock(storageMutex);

        try {
            fs::create_directories(dataDir);
            return true;
        } catch (const std::exception& e) {
            std::cerr << "Error: Cannot create data directory " << dataDir << ": " << e.what() << std::endl;
            return false;
        }
    }

    // ==== IMPLEMENTACION DE TEMPLATES DE SERIALIZACION ====
    template<typename T>
    void AuctionStateStore::writeBinary(std::ostream& out, const T& value) const {
        out.write(reinterpret_cast<const char*>(&value), sizeof(T));
    }

    template<typename T>
    void AuctionStateStore::readBinary(std::istream& in, T& value) const {
        in.read(reinterpret_cast<char*>(&value), sizeof(T));
        if (!in) {
            throw std::runtime_error("Unexpected end of snapshot data");
        }
    }

    void AuctionStateStore::writeVector(std::ostream& out, const std::vector<uint8_t>& data) const {
        uint64_t size = data.size();
        writeBinary(out, size);
        if (size > 0) {
            out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(size));
        }
    }

    std::vector<uint8_t> AuctionStateStore::readVector(std::istream& in) const {
        uint64_t size = 0;
        readBinary(in, size);

        if (size == 0) {
            return {};
        }

        if (size > MAX_SNAPSHOT_FILE_SIZE) {
            throw std::runtime_error("Vector size too large: " + std::to_string(size));
        }

        std::vector<uint8_t> data(size);
        in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
        if (!in) {
            throw std::runtime_error("Unexpected end of snapshot data");
        }
        return data;
    }

    void AuctionStateStore::writeString(std::ostream& out, const std::string& str) const {
        uint64_t size = str.size();
        writeBinary(out, size);
        if (size > 0) {
            out.write(str.data(), static_cast<std::streamsize>(size));
        }
    }

    std::string AuctionStateStore::readString(std::istream& in) const {
        uint64_t size = 0;
        readBinary(in, size);

        if (size == 0) {
            return "";
        }

        if (size > 1024) { // Direcciones y textos cortos
            throw std::runtime_error("String size too large: " + std::to_string(size));
        }

        std::string str(size, '\0');
        in.read(&str[0], static_cast<std::streamsize>(size));
        if (!in) {
            throw std::runtime_error("Unexpected end of snapshot data");
        }
        return str;
    }

    void AuctionStateStore::writeAmount(std::ostream& out, const Amount& value) const {
        std::vector<uint8_t> bytes = amountToBytes(value);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    Amount AuctionStateStore::readAmount(std::istream& in) const {
        std::vector<uint8_t> bytes(ABI_WORD_SIZE);
        in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!in) {
            throw std::runtime_error("Unexpected end of snapshot data");
        }
        return amountFromBytes(bytes.data(), bytes.size());
    }

    void AuctionStateStore::writeKey(std::ostream& out, const AuctionKey& key) const {
        writeBinary(out, key.creatorId);
        writeBinary(out, key.contentId);
    }

    AuctionKey AuctionStateStore::readKey(std::istream& in) const {
        AuctionKey key;
        readBinary(in, key.creatorId);
        readBinary(in, key.contentId);
        return key;
    }

    uint32_t AuctionStateStore::readCount(std::istream& in, uint32_t limit, const char* what) const {
        uint32_t count = 0;
        readBinary(in, count);
        if (count > limit) {
            throw std::runtime_error(std::string("Too many ") + what + " in snapshot: " + std::to_string(count));
        }
        return count;
    }

    uint32_t AuctionStateStore::calculateChecksum(const std::vector<uint8_t>& data) {
        return static_cast<uint32_t>(::crc32(0L,
            reinterpret_cast<const unsigned char*>(data.data()),
            static_cast<uInt>(data.size())));
    }

    // ==== SERIALIZACION DEL CUERPO ====
    std::vector<uint8_t> AuctionStateStore::serializeSnapshot(const AuctionSnapshot& snapshot) const {
        std::ostringstream out(std::ios::binary);

        // 1. Subastas
        writeBinary(out, static_cast<uint32_t>(snapshot.auctions.size()));
        for (const auto& key : sortedKeys(snapshot.auctions)) {
            const AuctionData& data = snapshot.auctions.at(key);
            writeKey(out, key);
            writeBinary(out, data.availableSinceTimestamp);
            writeBinary(out, data.startTimestamp);
            writeBinary(out, data.duration);
            writeBinary(out, data.minTimeAfterBid);
            writeBinary(out, data.endTimestamp);
            writeAmount(out, data.reservePrice);
            writeAmount(out, data.minBidIncrement);
            writeBinary(out, data.referralFeeBps);
            writeString(out, data.currency);
            writeBinary(out, static_cast<uint8_t>(data.onlyFollowers));
            writeBinary(out, static_cast<uint8_t>(data.collected));
            writeBinary(out, static_cast<uint8_t>(data.feeProcessed));
            writeAmount(out, data.winningBid);
            writeBinary(out, data.winnerId);
            writeString(out, data.creatorOwnerAddress);
            writeString(out, data.tokenData.name);
            writeString(out, data.tokenData.symbol);
            writeBinary(out, data.tokenData.royaltyBps);
        }

        // 2. Destinatarios
        writeBinary(out, static_cast<uint32_t>(snapshot.recipients.size()));
        for (const auto& key : sortedKeys(snapshot.recipients)) {
            const auto& list = snapshot.recipients.at(key);
            writeKey(out, key);
            writeBinary(out, static_cast<uint32_t>(list.size()));
            for (const auto& recipient : list) {
                writeString(out, recipient.recipient);
                writeBinary(out, recipient.splitBps);
            }
        }

        // 3. Referidos por pujador
        writeBinary(out, static_cast<uint32_t>(snapshot.referrals.size()));
        for (const auto& key : sortedKeys(snapshot.referrals)) {
            const BidderReferrals& bidders = snapshot.referrals.at(key);
            writeKey(out, key);

            std::vector<ProfileId> bidderIds;
            for (const auto& entry : bidders) {
                bidderIds.push_back(entry.first);
            }
            std::sort(bidderIds.begin(), bidderIds.end());

            writeBinary(out, static_cast<uint32_t>(bidderIds.size()));
            for (ProfileId bidderId : bidderIds) {
                const auto& ids = bidders.at(bidderId);
                writeBinary(out, bidderId);
                writeBinary(out, static_cast<uint32_t>(ids.size()));
                for (ProfileId referrer : ids) {
                    writeBinary(out, referrer);
                }
            }
        }

        // 4. Coleccionables desplegados
        writeBinary(out, static_cast<uint32_t>(snapshot.collectables.size()));
        for (const auto& key : sortedKeys(snapshot.collectables)) {
            writeKey(out, key);
            writeString(out, snapshot.collectables.at(key));
        }

        const std::string bytes = out.str();
        return std::vector<uint8_t>(bytes.begin(), bytes.end());
    }

    AuctionSnapshot AuctionStateStore::deserializeSnapshot(const std::vector<uint8_t>& data) const {
        std::istringstream in(std::string(data.begin(), data.end()), std::ios::binary);
        AuctionSnapshot snapshot;

        const uint32_t auctionCount = readCount(in, MAX_SNAPSHOT_ENTRIES, "auctions");
        for (uint32_t i = 0; i < auctionCount; ++i) {
            const AuctionKey key = readKey(in);
            AuctionData record;
            uint8_t onlyFollowers = 0, collected = 0, feeProcessed = 0;

            readBinary(in, record.availableSinceTimestamp);
            readBinary(in, record.startTimestamp);
            readBinary(in, record.duration);
            readBinary(in, record.minTimeAfterBid);
            readBinary(in, record.endTimestamp);
            record.reservePrice = readAmount(in);
            record.minBidIncrement = readAmount(in);
            readBinary(in, record.referralFeeBps);
            record.currency = readString(in);
            readBinary(in, onlyFollowers);
            readBinary(in, collected);
            readBinary(in, feeProcessed);
            record.winningBid = readAmount(in);
            readBinary(in, record.winnerId);
            record.creatorOwnerAddress = readString(in);
            record.tokenData.name = readString(in);
            record.tokenData.symbol = readString(in);
            readBinary(in, record.tokenData.royaltyBps);

            record.onlyFollowers = onlyFollowers != 0;
            record.collected = collected != 0;
            record.feeProcessed = feeProcessed != 0;
            snapshot.auctions[key] = record;
        }

        const uint32_t recipientKeys = readCount(in, MAX_SNAPSHOT_ENTRIES, "recipient lists");
        for (uint32_t i = 0; i < recipientKeys; ++i) {
            const AuctionKey key = readKey(in);
            const uint32_t count = readCount(in, MAX_RECIPIENTS, "recipients");
            std::vector<RecipientData> list;
            for (uint32_t j = 0; j < count; ++j) {
                RecipientData recipient;
                recipient.recipient = readString(in);
                readBinary(in, recipient.splitBps);
                list.push_back(recipient);
            }
            snapshot.recipients[key] = list;
        }

        const uint32_t referralKeys = readCount(in, MAX_SNAPSHOT_ENTRIES, "referral tables");
        for (uint32_t i = 0; i < referralKeys; ++i) {
            const AuctionKey key = readKey(in);
            const uint32_t bidderCount = readCount(in, MAX_SNAPSHOT_ENTRIES, "bidders");
            BidderReferrals& bidders = snapshot.referrals[key];
            for (uint32_t j = 0; j < bidderCount; ++j) {
                ProfileId bidderId = 0;
                readBinary(in, bidderId);
                const uint32_t idCount = readCount(in, MAX_REFERRERS, "referrers");
                std::vector<ProfileId> ids(idCount);
                for (uint32_t k = 0; k < idCount; ++k) {
                    readBinary(in, ids[k]);
                }
                bidders[bidderId] = ids;
            }
        }

        const uint32_t collectableCount = readCount(in, MAX_SNAPSHOT_ENTRIES, "collectables");
        for (uint32_t i = 0; i < collectableCount; ++i) {
            const AuctionKey key = readKey(in);
            snapshot.collectables[key] = readString(in);
        }

        if (in.peek() != std::char_traits<char>::eof()) {
            throw std::runtime_error("Trailing bytes after snapshot body");
        }

        return snapshot;
    }

    // ==== OPERACIONES DE SNAPSHOT ====
    bool AuctionStateStore::save(const AuctionSnapshot& snapshot) {
        std::lock_guard<std::recursive_mutex> lock(storageMutex);

        try {
            const std::vector<uint8_t> body = serializeSnapshot(snapshot);
            const std::string tempFile = snapshotFile + ".tmp";

            {
                std::ofstream file(tempFile, std::ios::binary | std::ios::trunc);
                if (!file) {
                    std::cerr << "Error: Cannot open " << tempFile << " for writing" << std::endl;
                    return false;
                }

                writeBinary(file, SNAPSHOT_MAGIC);
                writeBinary(file, SERIALIZATION_VERSION);
                writeVector(file, body);
                writeBinary(file, calculateChecksum(body));

                if (!file.good()) {
                    std::cerr << "Error: Failed writing snapshot to " << tempFile << std::endl;
                    return false;
                }
            }

            // Reemplazo atómico del snapshot anterior
            fs::rename(tempFile, snapshotFile);
            return true;
        } catch (const std::exception& e) {
            std::cerr << "Error saving auction state: " << e.what() << std::endl;
            return false;
        }
    }

    bool AuctionStateStore::load(AuctionSnapshot& snapshot) const {
        std::lock_guard<std::recursive_mutex> lock(storageMutex);

        try {
            if (!fs::exists(snapshotFile)) {
                return false;
            }

            if (fs::file_size(snapshotFile) > MAX_SNAPSHOT_FILE_SIZE) {
                std::cerr << "Error: Snapshot file too large: " << snapshotFile << std::endl;
                return false;
            }

            std::ifstream file(snapshotFile, std::ios::binary);
            if (!file) return false;

            uint32_t magic = 0;
            readBinary(file, magic);
            if (magic != SNAPSHOT_MAGIC) {
                std::cerr << "Error: Invalid snapshot magic in " << snapshotFile << std::endl;
                return false;
            }

            uint32_t version = 0;
            readBinary(file, version);
            if (version != SERIALIZATION_VERSION) {
                std::cerr << "Error: Unsupported snapshot version " << version << std::endl;
                return false;
            }

            std::vector<uint8_t> body = readVector(file);

            uint32_t storedChecksum = 0;
            readBinary(file, storedChecksum);
            if (calculateChecksum(body) != storedChecksum) {
                std::cerr << "Error: Snapshot checksum mismatch in " << snapshotFile << std::endl;
                return false;
            }

            snapshot = deserializeSnapshot(body);
            return true;
        } catch (const std::exception& e) {
            std::cerr << "Error loading auction state: " << e.what() << std::endl;
            return false;
        }
    }

    bool AuctionStateStore::exists() const {
        std::lock_guard<std::recursive_mutex> lock(storageMutex);
        return fs::exists(snapshotFile);
    }

    bool AuctionStateStore::clear() {
        std::lock_guard<std::recursive_mutex> lock(storageMutex);

        try {
            fs::remove(snapshotFile);
            return true;
        } catch (const std::exception& e) {
            std::cerr << "Error removing snapshot: " << e.what() << std::endl;
            return false;
        }
    }

} // namespace auction
