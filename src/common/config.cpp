#include "common/config.hpp"
#include "nlohmann/json.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
    template<typename T>
    void read_key(const json& j, const char* key, T& out) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return;
        try {
            out = it->get<T>();
        } catch (const json::exception& e) {
            throw std::runtime_error(std::string("Invalid value for config key '") + key + "': " + e.what());
        }
    }

    void read_millis(const json& j, const char* key, std::chrono::milliseconds& out) {
        uint64_t ms = static_cast<uint64_t>(out.count());
        read_key(j, key, ms);
        out = std::chrono::milliseconds(ms);
    }
}

void from_json(const json& j, Config& c) {
    int64_t port = c.port;
    read_key(j, "port", port);
    if (port < 0 || port > 65535) {
        throw std::runtime_error("Invalid value for config key 'port': " + std::to_string(port));
    }
    c.port = static_cast<uint16_t>(port);
    read_key(j, "data_dir", c.data_dir);
    read_key(j, "shared_dir", c.shared_dir);
    read_key(j, "downloads_dir", c.downloads_dir);
    read_key(j, "db_path", c.db_path);
    read_key(j, "chunk_size", c.chunk_size);
    read_key(j, "max_concurrent_fetches", c.max_concurrent_fetches);
    read_key(j, "upload_handler_threads", c.upload_handler_threads);
    read_millis(j, "pause_poll_ms", c.pause_poll_interval);
    read_millis(j, "io_timeout_ms", c.io_timeout);
    read_millis(j, "shutdown_grace_ms", c.shutdown_grace);
    read_key(j, "cleanup_partial_chunks", c.cleanup_partial_chunks);
    read_key(j, "cert_file", c.cert_file);
    read_key(j, "key_file", c.key_file);
    read_key(j, "ca_file", c.ca_file);
    read_key(j, "log_file", c.log_file);
    read_key(j, "log_level", c.log_level);

    std::vector<std::string> peer_strings;
    read_key(j, "peers", peer_strings);
    for (const auto& s : peer_strings) {
        auto peer = PeerEndpoint::parse(s);
        if (!peer) {
            throw std::runtime_error("Invalid peer address in config: " + s);
        }
        c.peers.push_back(*peer);
    }

    if (c.chunk_size == 0) {
        throw std::runtime_error("Invalid value for config key 'chunk_size': must be positive");
    }
    if (c.max_concurrent_fetches == 0) {
        throw std::runtime_error("Invalid value for config key 'max_concurrent_fetches': must be positive");
    }
    if (c.upload_handler_threads == 0) {
        throw std::runtime_error("Invalid value for config key 'upload_handler_threads': must be positive");
    }
}

Config Config::parse(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Could not parse config: ") + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Config must be a JSON object");
    }
    Config config;
    from_json(j, config);
    return config;
}

Config Config::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open config file: " + path.string());
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return parse(ss.str());
}

void Config::resolve_paths() {
    fs::path base(data_dir);
    if (shared_dir.empty()) shared_dir = (base / "shared").string();
    if (downloads_dir.empty()) downloads_dir = (base / "downloads").string();
    if (db_path.empty()) db_path = (base / "riftshare.db").string();
    if (cert_file.empty()) cert_file = (base / "server.crt").string();
    if (key_file.empty()) key_file = (base / "server.key").string();
}
