#ifndef COLLECT_AUCTION_AUCTION_STATE_STORE_HPP
#define COLLECT_AUCTION_AUCTION_STATE_STORE_HPP

#include "AuctionSnapshot.hpp"
#include "Types.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>
#include <zlib.h>

namespace auction {

    /**
     * Persistencia del estado del módulo en <dataDir>/auctions.bin
     *
     * Formato: magic | version | cuerpo con prefijo de longitud | CRC32 del cuerpo
     * Archivos corruptos o de otra versión se rechazan.
     */
    class AuctionStateStore {
        public:
            explicit AuctionStateStore(const std::string& dataDirectory);

            bool initialize();

            // ==== SNAPSHOT ====
            bool save(const AuctionSnapshot& snapshot);
            bool load(AuctionSnapshot& snapshot) const;
            bool exists() const;
            bool clear();

            const std::string& snapshotPath() const { return snapshotFile; }

            // ==== SERIALIZACION ====
            std::vector<uint8_t> serializeSnapshot(const AuctionSnapshot& snapshot) const;
            AuctionSnapshot deserializeSnapshot(const std::vector<uint8_t>& data) const;

            static uint32_t calculateChecksum(const std::vector<uint8_t>& data);

        private:
            // ==== HELPERS DE SERIALIZACION ====
            template<typename T>
            void writeBinary(std::ostream& out, const T& value) const;

            template<typename T>
            void readBinary(std::istream& in, T& value) const;

            void writeVector(std::ostream& out, const std::vector<uint8_t>& data) const;
            std::vector<uint8_t> readVector(std::istream& in) const;

            void writeString(std::ostream& out, const std::string& str) const;
            std::string readString(std::istream& in) const;

            void writeAmount(std::ostream& out, const Amount& value) const;
            Amount readAmount(std::istream& in) const;

            void writeKey(std::ostream& out, const AuctionKey& key) const;
            AuctionKey readKey(std::istream& in) const;

            uint32_t readCount(std::istream& in, uint32_t limit, const char* what) const;

            std::string dataDir;
            std::string snapshotFile;
            mutable std::recursive_mutex storageMutex;
    };

} // namespace auction

#endif // COLLECT_AUCTION_AUCTION_STATE_STORE_HPP
