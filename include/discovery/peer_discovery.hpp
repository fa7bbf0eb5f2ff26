#ifndef RIFT_PEER_DISCOVERY_HPP
#define RIFT_PEER_DISCOVERY_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Where a peer's upload server can be reached.
struct PeerEndpoint {
    std::string host;
    uint16_t port = 0;

    std::string to_string() const;

    // Parses "host:port". Returns nullopt on a missing host, a missing port or a port
    // outside 1..65535.
    static std::optional<PeerEndpoint> parse(const std::string& text);

    bool operator==(const PeerEndpoint& other) const {
        return host == other.host && port == other.port;
    }
    bool operator!=(const PeerEndpoint& other) const { return !(*this == other); }
};

/**
 * @brief Resolves an infohash to the peers that hold it.
 *
 * Implementations must be safe to call from any thread. find_peers() may block.
 */
class PeerDiscovery {
public:
    virtual ~PeerDiscovery() = default;

    // Advertise that this node holds the content. Returns false if the announcement failed.
    virtual bool announce(const std::string& infohash) = 0;

    // Peers holding the content, in preference order. Empty when nobody is known.
    virtual std::vector<PeerEndpoint> find_peers(const std::string& infohash) = 0;
};

#endif // RIFT_PEER_DISCOVERY_HPP
