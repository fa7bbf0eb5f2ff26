#include "network/stream_canceller.hpp"
#include "common/errors.hpp"
#include <algorithm>

StreamCanceller::Guard::Guard(StreamCanceller* canceller, ByteStream& stream)
    : canceller_(canceller), stream_(stream) {
    if (canceller_ && !canceller_->attach(stream_)) {
        throw NetworkError("Request cancelled");
    }
}

StreamCanceller::Guard::~Guard() {
    if (canceller_) canceller_->detach(stream_);
}

bool StreamCanceller::attach(ByteStream& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) return false;
    streams_.push_back(&stream);
    return true;
}

void StreamCanceller::detach(ByteStream& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    streams_.erase(std::remove(streams_.begin(), streams_.end(), &stream), streams_.end());
}

void StreamCanceller::cancel() {
    // Held while aborting so no stream is detached and destroyed underneath us.
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    for (ByteStream* stream : streams_) {
        stream->abort();
    }
}

bool StreamCanceller::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}
