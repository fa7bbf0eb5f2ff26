#ifndef RIFT_CONFIG_HPP
#define RIFT_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "../discovery/peer_discovery.hpp"
#include "../network/protocol.hpp"

struct Config {
    uint16_t port{DEFAULT_PORT};
    std::string data_dir{".riftshare"};
    std::string shared_dir;
    std::string downloads_dir;
    std::string db_path;
    uint32_t chunk_size{DEFAULT_CHUNK_SIZE};
    size_t max_concurrent_fetches{10};
    size_t upload_handler_threads{16};
    std::chrono::milliseconds pause_poll_interval{std::chrono::milliseconds(200)};
    std::chrono::milliseconds io_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds shutdown_grace{std::chrono::seconds(5)};
    bool cleanup_partial_chunks{false};
    std::string cert_file;
    std::string key_file;
    std::string ca_file;
    std::string log_file{"riftshare.log"};
    std::string log_level{"info"};
    std::vector<PeerEndpoint> peers;

    /**
     * @brief Loads a configuration from a JSON file.
     *
     * Keys that are absent keep their defaults and unknown keys are ignored.
     *
     * @throws std::runtime_error if the file cannot be read, is not a JSON object, or a key
     *         has the wrong type or an invalid value.
     */
    static Config load(const std::filesystem::path& path);

    // Same as load() but from an in-memory JSON document.
    static Config parse(const std::string& json_text);

    // Fills the empty directory and file settings from data_dir.
    void resolve_paths();
};

#endif // RIFT_CONFIG_HPP
