#include "files/chunker.hpp"
#include "crypto/hasher.hpp"
#include "common/errors.hpp"
#include <fstream>
#include <algorithm>

Manifest Chunker::create_manifest_from_file(const fs::path& file_path, uint32_t chunk_size) {
    if (chunk_size == 0) {
        throw IOError("Chunk size must be positive");
    }

    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec)) {
        throw IOError("File does not exist or is not a regular file: " + file_path.string());
    }
    uint64_t file_size = fs::file_size(file_path, ec);
    if (ec) {
        throw IOError("Cannot stat " + file_path.string() + ": " + ec.message());
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw IOError("Failed to open file: " + file_path.string());
    }

    Manifest manifest;
    manifest.file_name = file_path.filename().string();
    manifest.total_size = file_size;
    manifest.chunk_size = chunk_size;

    uint64_t count = Manifest::expected_chunk_count(file_size, chunk_size);
    if (count > MAX_CHUNK_COUNT) {
        throw IOError(file_path.string() + " needs " + std::to_string(count) + " chunks of " +
                      std::to_string(chunk_size) + " bytes; use a larger chunk size");
    }
    uint32_t chunk_count = static_cast<uint32_t>(count);
    manifest.chunk_hashes.reserve(chunk_count);

    std::vector<uint8_t> chunk_buffer(chunk_size);
    for (uint32_t i = 0; i < chunk_count; ++i) {
        uint64_t expected = std::min<uint64_t>(chunk_size, file_size - static_cast<uint64_t>(i) * chunk_size);

        chunk_buffer.resize(expected);
        file.read(reinterpret_cast<char*>(chunk_buffer.data()), static_cast<std::streamsize>(expected));
        if (static_cast<uint64_t>(file.gcount()) != expected) {
            throw IOError("Short read in " + file_path.string() + " at chunk " + std::to_string(i));
        }

        manifest.chunk_hashes.push_back(Hasher::content_hash(chunk_buffer));
    }

    return manifest;
}

std::vector<uint8_t> Chunker::read_span(const fs::path& file_path, uint64_t offset, uint64_t length) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw IOError("Failed to open file: " + file_path.string());
    }

    std::vector<uint8_t> buffer(length);
    file.seekg(static_cast<std::streamoff>(offset));
    if (!file) {
        throw IOError("Cannot seek to " + std::to_string(offset) + " in " + file_path.string());
    }
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    if (static_cast<uint64_t>(file.gcount()) != length) {
        throw IOError("Short read from " + file_path.string() + " at offset " + std::to_string(offset));
    }
    return buffer;
}
