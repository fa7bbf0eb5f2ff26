#ifndef RIFT_CHUNKER_HPP
#define RIFT_CHUNKER_HPP

#include "manifest.hpp"
#include "../network/protocol.hpp"
#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

class Chunker {
public:
    /**
     * @brief Creates a manifest for a given file.
     *
     * Streams the file in chunk_size windows (the last one may be short) and records the
     * hex SHA-256 of each window. The manifest file name is the final path component.
     *
     * @param file_path The path to the file to share.
     * @param chunk_size The size of each chunk in bytes.
     * @return A Manifest object for the file.
     * @throws IOError if the file cannot be opened or read completely.
     */
    static Manifest create_manifest_from_file(const fs::path& file_path, uint32_t chunk_size = DEFAULT_CHUNK_SIZE);

    // Reads exactly `length` bytes at `offset`. Throws IOError on a missing file or short read.
    static std::vector<uint8_t> read_span(const fs::path& file_path, uint64_t offset, uint64_t length);
};

#endif //RIFT_CHUNKER_HPP
