#ifndef RIFT_STREAM_CANCELLER_HPP
#define RIFT_STREAM_CANCELLER_HPP

#include "transport.hpp"
#include <mutex>
#include <vector>

/**
 * Aborts the open streams of an operation from another thread. Streams are attached while a
 * request is in flight; cancel() aborts every attached stream and refuses new ones.
 */
class StreamCanceller {
public:
    // Keeps a stream attached for the guard's lifetime. A null canceller attaches nothing.
    class Guard {
    public:
        /**
         * @throws NetworkError if the canceller has already been cancelled.
         */
        Guard(StreamCanceller* canceller, ByteStream& stream);
        ~Guard();

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        StreamCanceller* canceller_;
        ByteStream& stream_;
    };

    void cancel();
    bool cancelled() const;

private:
    mutable std::mutex mutex_;
    std::vector<ByteStream*> streams_;
    bool cancelled_ = false;

    bool attach(ByteStream& stream);
    void detach(ByteStream& stream);
};

#endif // RIFT_STREAM_CANCELLER_HPP
