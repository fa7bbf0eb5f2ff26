#ifndef RIFT_HASHER_HPP
#define RIFT_HASHER_HPP

#include <vector>
#include <string>
#include "../files/manifest.hpp" // For hash_t

namespace Hasher {

/**
 * @brief Calculates the SHA-256 hash of a data buffer.
 * @param data The data to hash.
 * @return A 32-byte SHA-256 hash.
 */
hash_t sha256(const std::vector<uint8_t>& data);

    // Calculate SHA-256 hash of a string
    hash_t sha256(const std::string& data);

    std::string hash_to_hex(const hash_t& hash);

    // Lowercase hex SHA-256 of the bytes; the digest used for chunks and infohashes.
    std::string content_hash(const std::vector<uint8_t>& data);
    std::string content_hash(const std::string& data);

    /**
     * @brief Content identifier of a manifest.
     * @return content_hash() of the canonical manifest encoding.
     */
    std::string info_hash(const Manifest& manifest);

    // True for exactly 64 lowercase hex characters.
    bool is_hex_digest(const std::string& text);

} // namespace Hasher

#endif //RIFT_HASHER_HPP
