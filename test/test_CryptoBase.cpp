#include <gtest/gtest.h>
#include "CryptoBase.hpp"
#include "Types.hpp"
#include <vector>
#include <string>
#include <chrono>
#include <map>

// ============================================================================
// FIXTURE PRINCIPAL PARA TESTS DE CRYPTOBASE
// ============================================================================

class CryptoBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Inicializar libsodium una vez para todos los tests
        static bool initialized = false;
        if (!initialized) {
            ASSERT_TRUE(CryptoBase::initialize()) << "Failed to initialize libsodium";
            initialized = true;
        }

        testStartTime = std::chrono::high_resolution_clock::now();

        testData = "Hello, Auction World!";
        testBinaryData = {0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77,
                          0x88, 0x99, 0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF};
    }

    void TearDown() override {
        auto endTime = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - testStartTime);
        std::cout << "[METRICS] CryptoBaseTest completed - Duration: " << duration.count() << "ms" << std::endl;
    }

    std::chrono::high_resolution_clock::time_point testStartTime;

    std::string testData;
    std::vector<uint8_t> testBinaryData;
};

// ============================================================================
// SECCIÓN 1: TESTS BÁSICOS DE HASHING SHA-256
// ============================================================================

TEST_F(CryptoBaseTest, Sha256KnownVectors) {
    EXPECT_EQ(CryptoBase::sha256(std::string("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(CryptoBase::sha256(std::string("")),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(CryptoBaseTest, Sha256ConsistencyBetweenOverloads) {
    std::vector<uint8_t> asVector(testData.begin(), testData.end());

    EXPECT_EQ(CryptoBase::sha256(testData), CryptoBase::sha256(asVector));
    EXPECT_EQ(CryptoBase::sha256(asVector), CryptoBase::hexEncode(CryptoBase::sha256Bytes(asVector)));
    EXPECT_EQ(CryptoBase::sha256Bytes(asVector).size(), SHA256_HASH_SIZE);
}

TEST_F(CryptoBaseTest, Sha256Deterministic) {
    std::string first = CryptoBase::sha256(testBinaryData);
    std::string second = CryptoBase::sha256(testBinaryData);
    EXPECT_EQ(first, second);

    std::vector<uint8_t> modified = testBinaryData;
    modified[0] ^= 0x01;
    EXPECT_NE(first, CryptoBase::sha256(modified));
}

// ============================================================================
// SECCIÓN 2: TESTS DE HEX ENCODING/DECODING
// ============================================================================

TEST_F(CryptoBaseTest, HexEncodeDecodeRoundTrip) {
    std::string encoded = CryptoBase::hexEncode(testBinaryData);
    EXPECT_EQ(encoded, "00112233445566778899aabbccddeeff");
    EXPECT_EQ(CryptoBase::hexDecode(encoded), testBinaryData);
}

TEST_F(CryptoBaseTest, HexDecodeAcceptsUppercase) {
    std::vector<uint8_t> expected = {0xAB, 0xCD, 0xEF};
    EXPECT_EQ(CryptoBase::hexDecode("ABCDEF"), expected);
}

TEST_F(CryptoBaseTest, HexEmptyData) {
    EXPECT_EQ(CryptoBase::hexEncode({}), "");
    EXPECT_TRUE(CryptoBase::hexDecode("").empty());
}

TEST_F(CryptoBaseTest, HexInvalidInputThrowsException) {
    EXPECT_THROW(CryptoBase::hexDecode("abc"), std::invalid_argument);
    EXPECT_THROW(CryptoBase::hexDecode("zz"), std::invalid_argument);
}
