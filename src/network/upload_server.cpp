#include "network/upload_server.hpp"
#include "network/protocol.hpp"
#include "common/serializer.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <asio/post.hpp>

UploadServer::UploadServer(Transport& transport, ContentStore& store, uint16_t port,
                           size_t handler_threads, std::chrono::milliseconds shutdown_grace)
    : transport_(transport),
      store_(store),
      configured_port_(port),
      handler_threads_(handler_threads == 0 ? 1 : handler_threads),
      shutdown_grace_(shutdown_grace) {}

UploadServer::~UploadServer() {
    stop();
}

void UploadServer::start() {
    if (running_) return;

    listener_ = transport_.open_listener(configured_port_);
    handlers_ = std::make_unique<asio::thread_pool>(handler_threads_);
    running_ = true;
    accept_thread_ = std::thread(&UploadServer::accept_loop, this);
    LOG_INFO("Upload server listening on port ", listener_->port(), " with ", handler_threads_, " handler threads");
}

uint16_t UploadServer::port() const {
    return listener_ ? listener_->port() : 0;
}

void UploadServer::accept_loop() {
    while (running_) {
        std::unique_ptr<ByteStream> accepted;
        try {
            accepted = listener_->accept();
        } catch (const std::exception& e) {
            if (!running_) break;
            LOG_WARN("Error accepting connection: ", e.what());
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }
        if (!accepted) break;

        std::shared_ptr<ByteStream> stream(std::move(accepted));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_.insert(stream.get());
        }
        asio::post(*handlers_, [this, stream]() { serve(stream); });
    }
    LOG_DEBUG("Accept loop finished");
}

void UploadServer::serve(const std::shared_ptr<ByteStream>& stream) {
    handle_connection(*stream);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.erase(stream.get());
    }
    idle_.notify_all();
}

void UploadServer::handle_connection(ByteStream& stream) {
    try {
        auto first = stream.read_line(MAX_HEADER_LINE);
        if (!first) {
            stream.close();
            return;
        }
        auto second = stream.read_line(MAX_HEADER_LINE);
        if (!second) {
            throw ProtocolError("Request ends after the first header line");
        }

        Request request = Serializer::parse_request(*first, *second);
        if (request.type == RequestType::METADATA) {
            auto bytes = store_.load_manifest_bytes(request.infohash);
            if (bytes) {
                stream.write_string(*bytes);
                LOG_DEBUG("Served manifest ", request.infohash);
            } else {
                LOG_DEBUG("No manifest for ", request.infohash);
            }
        } else {
            auto manifest = store_.find_manifest(request.infohash);
            if (manifest) {
                auto data = store_.read_chunk(*manifest, request.chunk_index);
                stream.write(data);
                LOG_DEBUG("Served chunk ", request.chunk_index, " of ", request.infohash, " (", data.size(), " bytes)");
            } else {
                LOG_DEBUG("Chunk request for unknown content ", request.infohash);
            }
        }
    } catch (const ProtocolError& e) {
        LOG_WARN("Dropping malformed request: ", e.what());
    } catch (const IOError& e) {
        LOG_WARN("Cannot serve request: ", e.what());
    } catch (const NetworkError& e) {
        LOG_DEBUG("Connection error while serving: ", e.what());
    } catch (const std::exception& e) {
        LOG_ERR("Unexpected error while serving: ", e.what());
    }
    stream.close();
}

void UploadServer::stop() {
    if (!running_.exchange(false)) return;

    listener_->close();
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!idle_.wait_for(lock, shutdown_grace_, [this] { return active_.empty(); })) {
            LOG_WARN("Aborting ", active_.size(), " upload(s) still running after ",
                     shutdown_grace_.count(), " ms");
            for (ByteStream* stream : active_) {
                stream->abort();
            }
        }
    }

    handlers_->join();
    handlers_.reset();
    listener_.reset();
    LOG_INFO("Upload server stopped");
}
