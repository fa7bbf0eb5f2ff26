#ifndef RIFT_TRANSPORT_HPP
#define RIFT_TRANSPORT_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// One bidirectional, already-encrypted byte stream. All calls block; failures throw NetworkError.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    virtual void write(const std::vector<uint8_t>& data) = 0;
    void write_string(const std::string& data) { write(std::vector<uint8_t>(data.begin(), data.end())); }

    /**
     * @brief Reads one '\n'-terminated line, returned without the terminator or a trailing '\r'.
     *
     * A final line closed by EOF instead of '\n' is returned as is.
     *
     * @return std::nullopt on EOF before any byte.
     * @throws ProtocolError if more than max_length bytes arrive without a terminator.
     */
    virtual std::optional<std::string> read_line(size_t max_length) = 0;

    // Everything up to EOF. Throws ProtocolError once more than max_bytes have arrived.
    virtual std::vector<uint8_t> read_to_end(size_t max_bytes) = 0;

    // Graceful close (TLS close_notify). Never throws.
    virtual void close() = 0;

    // Forced shutdown; safe to call from another thread while an operation is blocked.
    virtual void abort() = 0;
};

class Listener {
public:
    virtual ~Listener() = default;

    // Blocks for the next connection; nullptr once the listener has been closed.
    virtual std::unique_ptr<ByteStream> accept() = 0;

    // Thread-safe. Wakes a blocked accept().
    virtual void close() = 0;

    virtual uint16_t port() const = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    // Throws NetworkError if the peer cannot be reached or the handshake fails.
    virtual std::unique_ptr<ByteStream> open_client_stream(const std::string& host, uint16_t port) = 0;

    // Port 0 binds an ephemeral port. Throws NetworkError if the port cannot be bound.
    virtual std::unique_ptr<Listener> open_listener(uint16_t port) = 0;
};

#endif // RIFT_TRANSPORT_HPP
