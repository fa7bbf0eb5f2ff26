#ifndef RIFT_STATIC_PEER_DISCOVERY_HPP
#define RIFT_STATIC_PEER_DISCOVERY_HPP

#include "peer_discovery.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// In-process peer directory. Holders registered for an infohash come first, then the seed
// peers from the configuration.
class StaticPeerDiscovery : public PeerDiscovery {
public:
    explicit StaticPeerDiscovery(std::vector<PeerEndpoint> seeds = {},
                                 std::optional<PeerEndpoint> self = std::nullopt);

    bool announce(const std::string& infohash) override;
    std::vector<PeerEndpoint> find_peers(const std::string& infohash) override;

    void add_peer(const std::string& infohash, const PeerEndpoint& peer);
    void add_seed(const PeerEndpoint& peer);
    std::vector<PeerEndpoint> get_seeds() const;

private:
    mutable std::mutex mutex_;
    std::vector<PeerEndpoint> seeds_;
    std::optional<PeerEndpoint> self_;
    std::map<std::string, std::vector<PeerEndpoint>> holders_;
};

#endif // RIFT_STATIC_PEER_DISCOVERY_HPP
