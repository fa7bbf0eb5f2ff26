#include "common/serializer.hpp"
#include "common/errors.hpp"
#include "crypto/hasher.hpp"
#include "nlohmann/json.hpp"
#include <set>

using json = nlohmann::json;

namespace {
    const char* KEY_CHUNK_HASHES = "chunkHashes";
    const char* KEY_CHUNK_SIZE = "chunkSize";
    const char* KEY_FILENAME = "filename";
    const char* KEY_TOTAL_SIZE = "totalSize";
}

// JSON serialization for Manifest. nlohmann::json objects keep their keys sorted,
// which is what makes the dump canonical.
void to_json(json& j, const Manifest& m) {
    j = json{
        {KEY_FILENAME, m.file_name},
        {KEY_TOTAL_SIZE, m.total_size},
        {KEY_CHUNK_SIZE, m.chunk_size},
        {KEY_CHUNK_HASHES, m.chunk_hashes}
    };
}

void from_json(const json& j, Manifest& m) {
    j.at(KEY_FILENAME).get_to(m.file_name);
    j.at(KEY_TOTAL_SIZE).get_to(m.total_size);
    j.at(KEY_CHUNK_SIZE).get_to(m.chunk_size);
    j.at(KEY_CHUNK_HASHES).get_to(m.chunk_hashes);
}

namespace Serializer {

std::string serialize_manifest(const Manifest& m) {
    json j = m;
    try {
        return j.dump();
    } catch (const json::type_error& e) {
        throw ProtocolError(std::string("Cannot encode manifest: ") + e.what());
    }
}

Manifest deserialize_manifest(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ProtocolError(std::string("Manifest is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ProtocolError("Manifest is not a JSON object");
    }

    static const std::set<std::string> known = {KEY_CHUNK_HASHES, KEY_CHUNK_SIZE, KEY_FILENAME, KEY_TOTAL_SIZE};
    for (const auto& item : j.items()) {
        if (known.count(item.key()) == 0) {
            throw ProtocolError("Manifest has unexpected key '" + item.key() + "'");
        }
    }

    const json& total = j.contains(KEY_TOTAL_SIZE) ? j[KEY_TOTAL_SIZE] : json();
    const json& chunk = j.contains(KEY_CHUNK_SIZE) ? j[KEY_CHUNK_SIZE] : json();
    if (!total.is_number_unsigned() && !(total.is_number_integer() && total.get<int64_t>() >= 0)) {
        throw ProtocolError("Manifest totalSize must be a non-negative integer");
    }
    if (!chunk.is_number_integer() || chunk.get<int64_t>() <= 0 || chunk.get<uint64_t>() > UINT32_MAX) {
        throw ProtocolError("Manifest chunkSize must be a positive 32-bit integer");
    }

    Manifest m;
    try {
        j.get_to(m);
    } catch (const json::exception& e) {
        throw ProtocolError(std::string("Malformed manifest: ") + e.what());
    }
    m.validate();
    return m;
}

Manifest deserialize_manifest(const std::vector<uint8_t>& buffer) {
    return deserialize_manifest(std::string(buffer.begin(), buffer.end()));
}

std::string serialize_request(const Request& request) {
    if (request.type == RequestType::METADATA) {
        return std::string(METADATA_REQUEST_MARKER) + "\n" + request.infohash + "\n";
    }
    return request.infohash + "\n" + std::to_string(request.chunk_index) + "\n";
}

Request parse_request(const std::string& first_line, const std::string& second_line) {
    Request request;
    if (first_line == METADATA_REQUEST_MARKER) {
        request.type = RequestType::METADATA;
        request.infohash = second_line;
    } else {
        request.type = RequestType::CHUNK;
        request.infohash = first_line;
        request.chunk_index = parse_chunk_index(second_line);
    }
    if (!Hasher::is_hex_digest(request.infohash)) {
        throw ProtocolError("Request infohash is not a hex digest");
    }
    return request;
}

uint32_t parse_chunk_index(const std::string& text) {
    if (text.empty() || text.size() > 10) {
        throw ProtocolError("Malformed chunk index '" + text + "'");
    }
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw ProtocolError("Malformed chunk index '" + text + "'");
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value > UINT32_MAX) {
        throw ProtocolError("Chunk index out of range: " + text);
    }
    return static_cast<uint32_t>(value);
}

} // namespace Serializer
