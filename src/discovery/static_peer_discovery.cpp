#include "discovery/static_peer_discovery.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>

namespace {
    void append_unique(std::vector<PeerEndpoint>& peers, const PeerEndpoint& peer) {
        if (std::find(peers.begin(), peers.end(), peer) == peers.end()) {
            peers.push_back(peer);
        }
    }
}

std::string PeerEndpoint::to_string() const {
    return host + ":" + std::to_string(port);
}

std::optional<PeerEndpoint> PeerEndpoint::parse(const std::string& text) {
    auto pos = text.rfind(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 >= text.size()) {
        return std::nullopt;
    }
    std::string port_str = text.substr(pos + 1);
    if (port_str.size() > 5 || !std::all_of(port_str.begin(), port_str.end(),
                                            [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    unsigned long port = std::stoul(port_str);
    if (port == 0 || port > 65535) {
        return std::nullopt;
    }
    return PeerEndpoint{text.substr(0, pos), static_cast<uint16_t>(port)};
}

StaticPeerDiscovery::StaticPeerDiscovery(std::vector<PeerEndpoint> seeds, std::optional<PeerEndpoint> self)
    : seeds_(std::move(seeds)), self_(std::move(self)) {}

bool StaticPeerDiscovery::announce(const std::string& infohash) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (self_) {
        append_unique(holders_[infohash], *self_);
    }
    LOG_INFO("Announced infohash ", infohash, " to ", seeds_.size(), " static peer(s)");
    return true;
}

std::vector<PeerEndpoint> StaticPeerDiscovery::find_peers(const std::string& infohash) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PeerEndpoint> peers;
    auto it = holders_.find(infohash);
    if (it != holders_.end()) {
        for (const auto& peer : it->second) {
            if (!self_ || peer != *self_) append_unique(peers, peer);
        }
    }
    for (const auto& seed : seeds_) {
        if (!self_ || seed != *self_) append_unique(peers, seed);
    }
    LOG_DEBUG("Discovery found ", peers.size(), " peer(s) for ", infohash);
    return peers;
}

void StaticPeerDiscovery::add_peer(const std::string& infohash, const PeerEndpoint& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    append_unique(holders_[infohash], peer);
}

void StaticPeerDiscovery::add_seed(const PeerEndpoint& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    append_unique(seeds_, peer);
}

std::vector<PeerEndpoint> StaticPeerDiscovery::get_seeds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seeds_;
}
