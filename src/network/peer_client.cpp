#include "network/peer_client.hpp"
#include "network/protocol.hpp"
#include "common/serializer.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/hasher.hpp"

PeerClient::PeerClient(Transport& transport) : transport_(transport) {}

std::vector<uint8_t> PeerClient::request(const PeerEndpoint& peer, const std::string& header, size_t max_bytes,
                                         StreamCanceller* canceller) {
    if (canceller && canceller->cancelled()) {
        throw NetworkError("Request to " + peer.to_string() + " cancelled");
    }
    auto stream = transport_.open_client_stream(peer.host, peer.port);
    StreamCanceller::Guard guard(canceller, *stream);
    try {
        stream->write_string(header);
        auto response = stream->read_to_end(max_bytes);
        stream->close();
        return response;
    } catch (const std::exception&) {
        stream->abort();
        throw;
    }
}

std::vector<uint8_t> PeerClient::fetch_chunk(const PeerEndpoint& peer, const std::string& infohash,
                                             uint32_t index, size_t max_bytes, StreamCanceller* canceller) {
    Request req;
    req.type = RequestType::CHUNK;
    req.infohash = infohash;
    req.chunk_index = index;

    auto data = request(peer, Serializer::serialize_request(req), max_bytes, canceller);
    if (data.empty()) {
        throw NetworkError("empty response from " + peer.to_string() + " for chunk " + std::to_string(index));
    }
    return data;
}

std::optional<Manifest> PeerClient::fetch_manifest(const PeerEndpoint& peer, const std::string& infohash) {
    Request req;
    req.type = RequestType::METADATA;
    req.infohash = infohash;

    auto data = request(peer, Serializer::serialize_request(req), MAX_MANIFEST_BYTES);
    if (data.empty()) {
        return std::nullopt;
    }

    Manifest manifest = Serializer::deserialize_manifest(data);
    if (Hasher::info_hash(manifest) != infohash) {
        throw IntegrityError("Manifest from " + peer.to_string() + " does not match " + infohash);
    }
    return manifest;
}

std::optional<Manifest> PeerClient::find_manifest(const std::vector<PeerEndpoint>& peers, const std::string& infohash) {
    for (const auto& peer : peers) {
        try {
            auto manifest = fetch_manifest(peer, infohash);
            if (manifest) {
                LOG_INFO("Got manifest for ", infohash, " from ", peer.to_string());
                return manifest;
            }
            LOG_DEBUG(peer.to_string(), " does not have ", infohash);
        } catch (const std::exception& e) {
            LOG_WARN("Manifest request to ", peer.to_string(), " failed: ", e.what());
        }
    }
    return std::nullopt;
}
