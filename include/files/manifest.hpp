#ifndef RIFT_MANIFEST_HPP
#define RIFT_MANIFEST_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <array>
#include <iostream>
#include <iomanip>

// SHA-256 produces a 32-byte hash; chunk hashes travel as 64 lowercase hex characters.
constexpr size_t HASH_SIZE = 32;
constexpr size_t HASH_HEX_SIZE = HASH_SIZE * 2;
using hash_t = std::array<uint8_t, HASH_SIZE>;

// Chunk indices travel as uint32_t.
constexpr uint64_t MAX_CHUNK_COUNT = UINT32_MAX;

struct Manifest {
    std::string file_name;
    uint64_t total_size = 0;
    uint32_t chunk_size = 0;
    std::vector<std::string> chunk_hashes; // hex digest per chunk, in offset order

    uint32_t chunk_count() const { return static_cast<uint32_t>(chunk_hashes.size()); }

    uint64_t chunk_offset(uint32_t index) const {
        return static_cast<uint64_t>(index) * chunk_size;
    }

    // Length of the span for `index`; the last chunk may be short.
    uint64_t chunk_length(uint32_t index) const;

    // Number of chunks a file of `total_size` bytes splits into. May exceed MAX_CHUNK_COUNT.
    static uint64_t expected_chunk_count(uint64_t total_size, uint32_t chunk_size);

    /**
     * @brief Checks the structural invariants.
     *
     * chunk_size is positive, the hash count equals ceil(total_size / chunk_size) and fits a
     * uint32_t index, and every hash is a 64-character lowercase hex string.
     *
     * @throws ProtocolError naming the violated invariant.
     */
    void validate() const;

    bool operator==(const Manifest& other) const {
        return file_name == other.file_name && total_size == other.total_size &&
               chunk_size == other.chunk_size && chunk_hashes == other.chunk_hashes;
    }
    bool operator!=(const Manifest& other) const { return !(*this == other); }

    // Helper function to print the manifest details
    void print(std::ostream& out = std::cout) const {
        out << "--- Manifest ---\n"
                  << "File Name:    " << file_name << "\n"
                  << "Total Size:   " << total_size << " bytes\n"
                  << "Chunk Size:   " << chunk_size << " bytes\n"
                  << "Chunk Count:  " << chunk_count() << "\n"
                  << "Chunk Hashes: (" << chunk_hashes.size() << ")\n";
        for (size_t i = 0; i < chunk_hashes.size(); ++i) {
            out << "  [" << std::setw(4) << std::setfill(' ') << i << "]: "
                      << chunk_hashes[i] << "\n";
        }
        out << "----------------\n";
    }
};

#endif //RIFT_MANIFEST_HPP
