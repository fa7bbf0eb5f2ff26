#ifndef RIFT_TLS_TRANSPORT_HPP
#define RIFT_TLS_TRANSPORT_HPP

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "transport.hpp"

struct TlsOptions {
    std::string cert_file;   // PEM chain presented by the listener
    std::string key_file;    // PEM private key for cert_file
    std::string ca_file;     // when set, client streams verify the peer against it
    std::string bind_address{"0.0.0.0"};
    std::chrono::milliseconds io_timeout{std::chrono::seconds(30)};
};

/**
 * A TLS stream that owns its io_context. Every blocking call runs one asynchronous operation
 * with io_context::run_for(), so each operation is bounded by the I/O timeout. A whole
 * read_line() or read_to_end() call is bounded by the same timeout, however the peer paces
 * its bytes.
 */
class TlsStream : public ByteStream {
public:
    using ssl_socket = asio::ssl::stream<asio::ip::tcp::socket>;

    TlsStream(asio::ssl::context& ssl_context, asio::ssl::stream_base::handshake_type role,
              std::chrono::milliseconds io_timeout);
    ~TlsStream() override;

    // Resolves, connects and completes the client handshake.
    void connect(const std::string& host, uint16_t port);

    void write(const std::vector<uint8_t>& data) override;
    std::optional<std::string> read_line(size_t max_length) override;
    std::vector<uint8_t> read_to_end(size_t max_bytes) override;
    void close() override;
    void abort() override;

    ssl_socket::lowest_layer_type& socket() { return stream_.lowest_layer(); }
    std::string remote_address() const;

private:
    asio::io_context io_context_;
    ssl_socket stream_;
    asio::ssl::stream_base::handshake_type role_;
    std::chrono::milliseconds io_timeout_;
    bool handshake_done_ = false;
    bool closed_ = false;
    bool eof_ = false;
    std::atomic<bool> aborted_{false};
    std::string read_buffer_;

    void run(std::chrono::milliseconds timeout);
    void ensure_open();
    void ensure_handshake();
    // Appends the next read to read_buffer_; false on clean EOF. Throws NetworkError past deadline.
    bool fill_buffer(std::chrono::steady_clock::time_point deadline);
    [[noreturn]] void fail(const std::string& what, const asio::error_code& error);
};

class TlsListener : public Listener {
public:
    TlsListener(asio::ssl::context& ssl_context, const std::string& bind_address, uint16_t port,
                std::chrono::milliseconds io_timeout);
    ~TlsListener() override;

    std::unique_ptr<ByteStream> accept() override;
    void close() override;
    uint16_t port() const override { return port_; }

private:
    asio::io_context io_context_;
    asio::ip::tcp::acceptor acceptor_;
    asio::ssl::context& ssl_context_;
    std::chrono::milliseconds io_timeout_;
    std::atomic<bool> closed_{false};
    uint16_t port_ = 0;
};

class TlsTransport : public Transport {
public:
    /**
     * @throws std::runtime_error if the configured certificate, key or CA file cannot be loaded.
     */
    explicit TlsTransport(TlsOptions options);

    std::unique_ptr<ByteStream> open_client_stream(const std::string& host, uint16_t port) override;
    std::unique_ptr<Listener> open_listener(uint16_t port) override;

private:
    TlsOptions options_;
    asio::ssl::context client_context_;
    std::unique_ptr<asio::ssl::context> server_context_;

    void init_client_context();
    void init_server_context();
};

#endif // RIFT_TLS_TRANSPORT_HPP
