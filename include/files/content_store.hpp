#ifndef RIFT_CONTENT_STORE_HPP
#define RIFT_CONTENT_STORE_HPP

#include "manifest.hpp"
#include "../network/protocol.hpp"
#include "../storage/storage_manager.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// A manifest the local node serves, with the file its chunks are read from.
struct SharedManifest {
    std::string infohash;
    Manifest manifest;
    std::filesystem::path source_path;
};

/**
 * Local content on disk: manifests and originals under the shared directory, per-download
 * chunk blobs and reassembled files under the downloads directory.
 *
 * Layout:
 *   <shared_dir>/<infohash>.rift          canonical manifest encoding
 *   <downloads_dir>/<infohash>/chunk_<i>  verified chunk blobs of an active download
 *   <downloads_dir>/<file_name>           reassembled output
 */
class ContentStore {
public:
    /**
     * @throws IOError if either directory cannot be created.
     */
    ContentStore(std::filesystem::path shared_dir,
                 std::filesystem::path downloads_dir,
                 StorageManager& index,
                 uint32_t chunk_size = DEFAULT_CHUNK_SIZE);

    ContentStore(const ContentStore&) = delete;
    ContentStore& operator=(const ContentStore&) = delete;

    /**
     * @brief Copies a file into the shared directory and publishes it.
     *
     * A file of the same name already in the shared directory is kept as is and becomes the
     * one that is published.
     *
     * @throws IOError if the copy fails or create_manifest() fails.
     */
    Manifest share_file(const std::filesystem::path& path);

    /**
     * @brief Chunks and hashes a file, writes <infohash>.rift and records a share row.
     *
     * The share row points at the absolute path of source_file, so chunks are later served
     * from that file directly.
     *
     * @throws IOError if the file cannot be fully read or the metadata cannot be written.
     */
    Manifest create_manifest(const std::filesystem::path& source_file);

    /**
     * @brief Reads chunk `index` of a shared file.
     * @throws IOError if the index is out of range, the file is missing or the read is short.
     */
    std::vector<uint8_t> read_chunk(const Manifest& manifest, uint32_t index);

    /**
     * @brief Concatenates the chunk blobs of a finished download into <downloads_dir>/<file_name>.
     *
     * The output is written under a temporary name and renamed into place only when every
     * blob was copied, so a failed reassembly never leaves a file at the destination. An
     * existing file of the same name is kept; the output then goes to
     * <stem>.<first 8 infohash chars><extension>.
     *
     * @return The path of the reassembled file.
     * @throws IOError naming the first missing chunk, or on any write failure.
     */
    std::filesystem::path reassemble(const Manifest& manifest, const std::string& infohash);

    // Decoded manifest for a local .rift file; nullopt if absent or unreadable.
    std::optional<Manifest> find_manifest(const std::string& infohash);
    // Raw .rift bytes as served to metadata requests.
    std::optional<std::string> load_manifest_bytes(const std::string& infohash);

    std::vector<SharedManifest> list_shared_manifests();
    std::optional<SharedManifest> find_manifest_by_name(const std::string& file_name);

    /**
     * @brief Stops sharing the file with the given name.
     *
     * Removes the .rift file and the share row. The original is deleted only when it lives in
     * the shared directory; files shared in place elsewhere are left alone.
     *
     * @return false if no share has that name.
     */
    bool remove_shared(const std::string& file_name);

    // Rebuilds the share index from the .rift files in the shared directory. Returns the row count.
    size_t rescan();

    std::filesystem::path metadata_path(const std::string& infohash) const;
    std::filesystem::path chunk_dir(const std::string& infohash) const;
    std::filesystem::path chunk_path(const std::string& infohash, uint32_t index) const;

    // Chunk blob helpers, each throwing IOError on failure.
    void prepare_chunk_dir(const std::string& infohash);
    void write_chunk(const std::string& infohash, uint32_t index, const std::vector<uint8_t>& data);
    void remove_chunk_dir(const std::string& infohash);

    const std::filesystem::path& shared_dir() const { return shared_dir_; }
    const std::filesystem::path& downloads_dir() const { return downloads_dir_; }
    uint32_t chunk_size() const { return chunk_size_; }

private:
    std::filesystem::path shared_dir_;
    std::filesystem::path downloads_dir_;
    StorageManager& index_;
    uint32_t chunk_size_;

    std::filesystem::path source_path_for(const std::string& infohash, const Manifest& manifest);
    bool is_inside_shared_dir(const std::filesystem::path& path) const;
};

#endif //RIFT_CONTENT_STORE_HPP
