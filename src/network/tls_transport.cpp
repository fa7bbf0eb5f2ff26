#include "network/tls_transport.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <array>

namespace {
    constexpr std::chrono::milliseconds SHUTDOWN_TIMEOUT{1000};
    constexpr size_t READ_CHUNK = 16 * 1024;

    void strip_carriage_return(std::string& line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
    }
}

// ---------------------------------------------------------------------------------------------
// TlsStream

TlsStream::TlsStream(asio::ssl::context& ssl_context, asio::ssl::stream_base::handshake_type role,
                     std::chrono::milliseconds io_timeout)
    : stream_(io_context_, ssl_context), role_(role), io_timeout_(io_timeout) {}

TlsStream::~TlsStream() {
    asio::error_code ignored;
    stream_.lowest_layer().close(ignored);
}

void TlsStream::run(std::chrono::milliseconds timeout) {
    io_context_.restart();
    io_context_.run_for(timeout);
    if (!io_context_.stopped()) {
        // Timed out: closing the socket completes the pending operation with operation_aborted.
        asio::error_code ignored;
        stream_.lowest_layer().close(ignored);
        io_context_.run();
    }
}

void TlsStream::fail(const std::string& what, const asio::error_code& error) {
    if (aborted_) {
        throw NetworkError(what + ": connection aborted");
    }
    if (error == asio::error::operation_aborted) {
        throw NetworkError(what + ": timed out");
    }
    throw NetworkError(what + ": " + error.message());
}

void TlsStream::ensure_open() {
    if (aborted_ || closed_) {
        throw NetworkError("Stream is closed");
    }
}

void TlsStream::ensure_handshake() {
    if (handshake_done_) return;
    asio::error_code error = asio::error::would_block;
    stream_.async_handshake(role_, [&error](const asio::error_code& ec) { error = ec; });
    run(io_timeout_);
    if (error) {
        fail("TLS handshake failed", error);
    }
    handshake_done_ = true;
}

void TlsStream::connect(const std::string& host, uint16_t port) {
    ensure_open();

    asio::error_code error;
    asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host, std::to_string(port), error);
    if (error) {
        throw NetworkError("Cannot resolve " + host + ": " + error.message());
    }

    error = asio::error::would_block;
    asio::async_connect(stream_.lowest_layer(), endpoints,
        [&error](const asio::error_code& ec, const asio::ip::tcp::endpoint&) { error = ec; });
    run(io_timeout_);
    if (error) {
        fail("Cannot connect to " + host + ":" + std::to_string(port), error);
    }

    asio::error_code not_an_address;
    asio::ip::make_address(host, not_an_address);
    if (not_an_address) {
        SSL_set_tlsext_host_name(stream_.native_handle(), host.c_str());
    }

    ensure_handshake();
}

void TlsStream::write(const std::vector<uint8_t>& data) {
    ensure_open();
    ensure_handshake();
    asio::error_code error = asio::error::would_block;
    asio::async_write(stream_, asio::buffer(data),
        [&error](const asio::error_code& ec, size_t) { error = ec; });
    run(io_timeout_);
    if (error) {
        fail("Write failed", error);
    }
}

bool TlsStream::fill_buffer(std::chrono::steady_clock::time_point deadline) {
    if (eof_) return false;

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining <= std::chrono::milliseconds::zero()) {
        throw NetworkError("Read failed: timed out");
    }

    std::array<char, READ_CHUNK> chunk;
    asio::error_code error = asio::error::would_block;
    size_t received = 0;
    stream_.async_read_some(asio::buffer(chunk),
        [&error, &received](const asio::error_code& ec, size_t bytes) {
            error = ec;
            received = bytes;
        });
    run(std::min(io_timeout_, remaining));

    read_buffer_.append(chunk.data(), received);
    if (error == asio::error::eof) {
        eof_ = true;
        return received > 0;
    }
    if (error) {
        fail("Read failed", error);
    }
    return true;
}

std::optional<std::string> TlsStream::read_line(size_t max_length) {
    ensure_open();
    ensure_handshake();
    const auto deadline = std::chrono::steady_clock::now() + io_timeout_;
    for (;;) {
        auto pos = read_buffer_.find('\n');
        if (pos != std::string::npos) {
            if (pos >= max_length) {
                throw ProtocolError("Header line too long");
            }
            std::string line = read_buffer_.substr(0, pos);
            read_buffer_.erase(0, pos + 1);
            strip_carriage_return(line);
            return line;
        }
        if (read_buffer_.size() >= max_length) {
            throw ProtocolError("Header line too long");
        }
        if (!fill_buffer(deadline)) {
            if (read_buffer_.empty()) {
                return std::nullopt;
            }
            std::string line;
            line.swap(read_buffer_);
            strip_carriage_return(line);
            return line;
        }
    }
}

std::vector<uint8_t> TlsStream::read_to_end(size_t max_bytes) {
    ensure_open();
    ensure_handshake();
    const auto deadline = std::chrono::steady_clock::now() + io_timeout_;
    while (read_buffer_.size() <= max_bytes && fill_buffer(deadline)) {
    }
    if (read_buffer_.size() > max_bytes) {
        throw ProtocolError("Response exceeds " + std::to_string(max_bytes) + " bytes");
    }
    std::vector<uint8_t> data(read_buffer_.begin(), read_buffer_.end());
    read_buffer_.clear();
    return data;
}

void TlsStream::close() {
    if (closed_) return;
    closed_ = true;

    if (!aborted_ && handshake_done_) {
        asio::error_code error = asio::error::would_block;
        stream_.async_shutdown([&error](const asio::error_code& ec) { error = ec; });
        run(std::min(io_timeout_, SHUTDOWN_TIMEOUT));
        // The peer may drop the connection without answering close_notify.
        if (error && error != asio::error::eof) {
            LOG_DEBUG("TLS shutdown: ", error.message());
        }
    }

    asio::error_code ignored;
    stream_.lowest_layer().shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    stream_.lowest_layer().close(ignored);
}

void TlsStream::abort() {
    aborted_ = true;
    asio::post(io_context_, [this]() {
        asio::error_code ignored;
        stream_.lowest_layer().shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        stream_.lowest_layer().close(ignored);
    });
}

std::string TlsStream::remote_address() const {
    asio::error_code ec;
    auto endpoint = stream_.lowest_layer().remote_endpoint(ec);
    if (ec) return "unknown";
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

// ---------------------------------------------------------------------------------------------
// TlsListener

TlsListener::TlsListener(asio::ssl::context& ssl_context, const std::string& bind_address, uint16_t port,
                         std::chrono::milliseconds io_timeout)
    : acceptor_(io_context_), ssl_context_(ssl_context), io_timeout_(io_timeout) {
    asio::error_code ec;
    auto address = asio::ip::make_address(bind_address, ec);
    if (ec) {
        throw NetworkError("Invalid bind address '" + bind_address + "'");
    }
    asio::ip::tcp::endpoint endpoint(address, port);

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        throw NetworkError("Cannot listen on port " + std::to_string(port) + ": " + ec.message());
    }
    port_ = acceptor_.local_endpoint(ec).port();
    LOG_INFO("Listening on TCP port ", port_);
}

TlsListener::~TlsListener() {
    asio::error_code ignored;
    acceptor_.close(ignored);
}

std::unique_ptr<ByteStream> TlsListener::accept() {
    while (!closed_) {
        auto stream = std::make_unique<TlsStream>(ssl_context_, asio::ssl::stream_base::server, io_timeout_);
        asio::error_code error = asio::error::would_block;
        acceptor_.async_accept(stream->socket(), [&error](const asio::error_code& ec) { error = ec; });
        io_context_.restart();
        io_context_.run();

        if (closed_) {
            return nullptr;
        }
        if (error == asio::error::operation_aborted) {
            continue;
        }
        if (error) {
            throw NetworkError("Accept failed: " + error.message());
        }
        LOG_DEBUG("Accepted connection from ", stream->remote_address());
        return stream;
    }
    return nullptr;
}

void TlsListener::close() {
    if (closed_.exchange(true)) return;
    asio::post(io_context_, [this]() {
        asio::error_code ignored;
        acceptor_.cancel(ignored);
    });
}

// ---------------------------------------------------------------------------------------------
// TlsTransport

TlsTransport::TlsTransport(TlsOptions options)
    : options_(std::move(options)), client_context_(asio::ssl::context::tls_client) {
    init_client_context();
    if (!options_.cert_file.empty() && !options_.key_file.empty()) {
        init_server_context();
    }
}

void TlsTransport::init_client_context() {
    client_context_.set_options(
        asio::ssl::context::default_workarounds
        | asio::ssl::context::no_sslv2
        | asio::ssl::context::no_sslv3
        | asio::ssl::context::no_tlsv1
        | asio::ssl::context::no_tlsv1_1);

    if (options_.ca_file.empty()) {
        // Peers present self-signed certificates; the channel is encrypted but not authenticated.
        client_context_.set_verify_mode(asio::ssl::verify_none);
        return;
    }
    try {
        client_context_.load_verify_file(options_.ca_file);
        client_context_.set_verify_mode(asio::ssl::verify_peer);
    } catch (const asio::system_error& e) {
        throw std::runtime_error("Error loading CA file " + options_.ca_file + ": " + e.what());
    }
}

void TlsTransport::init_server_context() {
    server_context_ = std::make_unique<asio::ssl::context>(asio::ssl::context::tls_server);
    try {
        server_context_->set_options(
            asio::ssl::context::default_workarounds
            | asio::ssl::context::no_sslv2
            | asio::ssl::context::no_sslv3
            | asio::ssl::context::no_tlsv1
            | asio::ssl::context::no_tlsv1_1);
        server_context_->use_certificate_chain_file(options_.cert_file);
        server_context_->use_private_key_file(options_.key_file, asio::ssl::context::file_format::pem);
    } catch (const asio::system_error& e) {
        throw std::runtime_error("Error initializing SSL context: " + std::string(e.what()));
    }
}

std::unique_ptr<ByteStream> TlsTransport::open_client_stream(const std::string& host, uint16_t port) {
    auto stream = std::make_unique<TlsStream>(client_context_, asio::ssl::stream_base::client, options_.io_timeout);
    stream->connect(host, port);
    return stream;
}

std::unique_ptr<Listener> TlsTransport::open_listener(uint16_t port) {
    if (!server_context_) {
        throw NetworkError("No certificate configured; cannot accept TLS connections");
    }
    return std::make_unique<TlsListener>(*server_context_, options_.bind_address, port, options_.io_timeout);
}
