#ifndef COLLECT_AUCTION_TYPES_H
#define COLLECT_AUCTION_TYPES_H

#include <cstdint>
#include <cstddef>

// -----------------------------------------------------------------------------------
// ---------------------------- Libsodium Types --------------------------------------
// -----------------------------------------------------------------------------------

inline constexpr size_t SHA256_HASH_SIZE = 32; // Tamaño del hash SHA-256

// ==== CONSTANTES DE DIRECCIONES ====
inline constexpr size_t ADDRESS_SIZE = 20;    // Dirección en bytes (20 bytes = 160 bits)
inline constexpr size_t ADDRESS_HEX_LENGTH = 40; // Dirección en hexadecimal (40 caracteres)

// ==== CONSTANTES DE SUBASTA ====
inline constexpr uint16_t BPS_MAX = 10000;     // 100% en puntos básicos
inline constexpr size_t MAX_RECIPIENTS = 5;    // Máximo de destinatarios del reparto
inline constexpr size_t MAX_REFERRERS = 32;    // Límite de referidos por pujador

// ==== CONSTANTES DE PAYLOAD ====
inline constexpr size_t ABI_WORD_SIZE = 32;    // Cada campo ocupa una palabra de 32 bytes
inline constexpr size_t TOKEN_TEXT_SIZE = 32;  // Nombre y símbolo del coleccionable (bytes32)
inline constexpr size_t MAX_PAYLOAD_SIZE = 64 * 1024; // 64 KB máximo

// ==== CONSTANTES DE SERIALIZACION ====
inline constexpr uint32_t SERIALIZATION_VERSION = 1;   // Versión de serialización
inline constexpr uint32_t SNAPSHOT_MAGIC = 0xA0C71011; // Mágico para el estado de subastas
inline constexpr size_t MAX_SNAPSHOT_FILE_SIZE = 64 * 1024 * 1024; // 64MB

#endif // COLLECT_AUCTION_TYPES_H
