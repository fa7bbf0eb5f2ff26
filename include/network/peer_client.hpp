#ifndef RIFT_PEER_CLIENT_HPP
#define RIFT_PEER_CLIENT_HPP

#include "transport.hpp"
#include "stream_canceller.hpp"
#include "../discovery/peer_discovery.hpp"
#include "../files/manifest.hpp"
#include <optional>
#include <string>
#include <vector>

// Request side of the wire protocol: one connection per request, response framed by EOF.
class PeerClient {
public:
    explicit PeerClient(Transport& transport);
    virtual ~PeerClient() = default;

    /**
     * @brief Downloads one raw chunk from a peer. The caller verifies the bytes.
     *
     * While the request is in flight its stream is attached to `canceller`, whose cancel()
     * aborts it from another thread.
     *
     * @throws NetworkError on connection failure, an empty response (the peer lacks the chunk)
     *         or cancellation.
     * @throws ProtocolError if the peer sends more than max_bytes.
     */
    virtual std::vector<uint8_t> fetch_chunk(const PeerEndpoint& peer, const std::string& infohash,
                                             uint32_t index, size_t max_bytes,
                                             StreamCanceller* canceller = nullptr);

    /**
     * @brief Asks a peer for the manifest of an infohash.
     * @return std::nullopt when the peer answers with zero bytes.
     * @throws NetworkError, ProtocolError if the bytes do not decode,
     *         IntegrityError if they decode to a manifest with a different infohash.
     */
    virtual std::optional<Manifest> fetch_manifest(const PeerEndpoint& peer, const std::string& infohash);

    // First manifest any of the peers returns, trying them in order. Failures are logged.
    std::optional<Manifest> find_manifest(const std::vector<PeerEndpoint>& peers, const std::string& infohash);

private:
    Transport& transport_;

    std::vector<uint8_t> request(const PeerEndpoint& peer, const std::string& header, size_t max_bytes,
                                 StreamCanceller* canceller = nullptr);
};

#endif // RIFT_PEER_CLIENT_HPP
