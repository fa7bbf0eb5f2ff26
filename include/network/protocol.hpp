#ifndef RIFT_PROTOCOL_HPP
#define RIFT_PROTOCOL_HPP

#include <cstddef>
#include <cstdint>
#include <string>

// Wire protocol: two header lines, then the response is framed by connection close.
//
//   metadata:  "GET_RIFT\n" "<infohash>\n"   -> canonical manifest encoding
//   chunk:     "<infohash>\n" "<index>\n"    -> raw chunk bytes
//
// A request that cannot be satisfied closes the connection without writing anything.

constexpr const char* METADATA_REQUEST_MARKER = "GET_RIFT";
constexpr const char* METADATA_EXTENSION = ".rift";
constexpr const char* CHUNK_FILE_PREFIX = "chunk_";

constexpr uint16_t DEFAULT_PORT = 4001;
constexpr uint32_t DEFAULT_CHUNK_SIZE = 1024 * 1024;

// Upper bound for one header line, terminator included.
constexpr size_t MAX_HEADER_LINE = 256;

// Largest canonical manifest encoding a client will accept.
constexpr size_t MAX_MANIFEST_BYTES = 64 * 1024 * 1024;

enum class RequestType : uint8_t {
    METADATA = 0,
    CHUNK = 1
};

struct Request {
    RequestType type = RequestType::CHUNK;
    std::string infohash;
    uint32_t chunk_index = 0;
};

#endif // RIFT_PROTOCOL_HPP
