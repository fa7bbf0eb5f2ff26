#ifndef RIFT_SERIALIZER_HPP
#define RIFT_SERIALIZER_HPP

#include "../files/manifest.hpp"
#include "../network/protocol.hpp"
#include <string>
#include <vector>

namespace Serializer {

/**
 * @brief Serializes a Manifest into its canonical encoding.
 *
 * Compact JSON with the keys chunkHashes, chunkSize, filename, totalSize in that order.
 * The same manifest always yields the same bytes, so the result is what the infohash covers.
 *
 * @throws ProtocolError if the file name is not valid UTF-8.
 */
std::string serialize_manifest(const Manifest& m);

/**
 * @brief Decodes a canonical manifest encoding.
 * @throws ProtocolError on malformed JSON, missing or extra keys, wrong types,
 *         or a manifest that fails Manifest::validate().
 */
Manifest deserialize_manifest(const std::string& text);
Manifest deserialize_manifest(const std::vector<uint8_t>& buffer);

// Header lines for a request, each terminated by '\n'.
std::string serialize_request(const Request& request);

/**
 * @brief Builds a Request from the two header lines read off the wire.
 *
 * Line terminators must already be removed. A first line equal to GET_RIFT makes a metadata
 * request for the infohash in the second line; otherwise the first line is the infohash and
 * the second the chunk index.
 *
 * @throws ProtocolError if the infohash is not a hex digest or the index is malformed.
 */
Request parse_request(const std::string& first_line, const std::string& second_line);

// Non-negative decimal that fits in 32 bits, digits only. Throws ProtocolError otherwise.
uint32_t parse_chunk_index(const std::string& text);

} // namespace Serializer

#endif //RIFT_SERIALIZER_HPP
