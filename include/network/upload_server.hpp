#ifndef RIFT_UPLOAD_SERVER_HPP
#define RIFT_UPLOAD_SERVER_HPP

#include <asio/thread_pool.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

#include "transport.hpp"
#include "../files/content_store.hpp"

class UploadServer {
public:
    UploadServer(Transport& transport, ContentStore& store, uint16_t port,
                 size_t handler_threads = 16,
                 std::chrono::milliseconds shutdown_grace = std::chrono::seconds(5));
    ~UploadServer();

    UploadServer(const UploadServer&) = delete;
    UploadServer& operator=(const UploadServer&) = delete;

    /**
     * @brief Binds the listener and starts the accept thread.
     * @throws NetworkError if the port cannot be bound.
     */
    void start();

    /**
     * @brief Stops accepting, gives running handlers shutdown_grace to finish, then aborts
     *        whatever is left and joins the handler pool.
     */
    void stop();

    bool is_running() const { return running_; }

    // Bound port, or 0 when not started.
    uint16_t port() const;

    /**
     * @brief Serves one request on an accepted stream and closes it.
     *
     * Reads the two header lines, answers a metadata or chunk request, or closes without
     * writing anything when the request is malformed or cannot be satisfied. Never throws.
     */
    void handle_connection(ByteStream& stream);

private:
    void accept_loop();
    void serve(const std::shared_ptr<ByteStream>& stream);

    Transport& transport_;
    ContentStore& store_;
    uint16_t configured_port_;
    size_t handler_threads_;
    std::chrono::milliseconds shutdown_grace_;

    std::unique_ptr<Listener> listener_;
    std::unique_ptr<asio::thread_pool> handlers_;
    std::thread accept_thread_;
    std::atomic<bool> running_{false};

    // Streams accepted and not yet finished, for the forced part of stop().
    std::mutex mutex_;
    std::condition_variable idle_;
    std::set<ByteStream*> active_;
};

#endif //RIFT_UPLOAD_SERVER_HPP
