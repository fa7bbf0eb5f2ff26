#include "files/manifest.hpp"
#include "common/errors.hpp"
#include "crypto/hasher.hpp"
#include <algorithm>
#include <limits>

uint64_t Manifest::chunk_length(uint32_t index) const {
    uint64_t offset = chunk_offset(index);
    if (index >= chunk_count() || offset >= total_size) return 0;
    return std::min<uint64_t>(chunk_size, total_size - offset);
}

uint64_t Manifest::expected_chunk_count(uint64_t total_size, uint32_t chunk_size) {
    if (chunk_size == 0) return 0;
    return total_size / chunk_size + (total_size % chunk_size != 0 ? 1 : 0);
}

void Manifest::validate() const {
    if (chunk_size == 0) {
        throw ProtocolError("Manifest chunk size must be positive");
    }
    uint64_t expected = expected_chunk_count(total_size, chunk_size);
    if (expected > MAX_CHUNK_COUNT) {
        throw ProtocolError("Manifest needs " + std::to_string(expected) + " chunks, more than " +
                            std::to_string(MAX_CHUNK_COUNT));
    }
    if (expected != chunk_hashes.size()) {
        throw ProtocolError("Manifest has " + std::to_string(chunk_hashes.size()) +
                            " chunk hashes, expected " + std::to_string(expected));
    }
    for (size_t i = 0; i < chunk_hashes.size(); ++i) {
        if (!Hasher::is_hex_digest(chunk_hashes[i])) {
            throw ProtocolError("Manifest chunk hash " + std::to_string(i) + " is not a hex digest");
        }
    }
}
