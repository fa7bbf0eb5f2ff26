#include "files/download_manager.hpp"
#include "crypto/hasher.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

const char* download_state_name(DownloadState state) {
    switch (state) {
        case DownloadState::Pending:      return "pending";
        case DownloadState::FindingPeers: return "finding peers";
        case DownloadState::Downloading:  return "downloading";
        case DownloadState::Paused:       return "paused";
        case DownloadState::Reassembling: return "reassembling";
        case DownloadState::Completed:    return "completed";
        case DownloadState::Cancelled:    return "cancelled";
        case DownloadState::Failed:       return "failed";
    }
    return "unknown";
}

bool is_terminal(DownloadState state) {
    return state == DownloadState::Completed ||
           state == DownloadState::Cancelled ||
           state == DownloadState::Failed;
}

struct DownloadManager::DownloadTask {
    std::string infohash;
    Manifest manifest;
    ProgressSink sink;
    std::thread runner;

    std::mutex mutex;
    std::condition_variable wake;
    DownloadState state = DownloadState::Pending;
    bool paused = false;
    bool cancelled = false;
    bool failed = false;
    std::string message;
    uint32_t completed = 0;
    uint32_t in_flight = 0;

    // Serializes sink calls so observers see snapshots in order.
    std::mutex sink_mutex;

    // Aborts in-flight chunk requests once the task is cancelled or has failed.
    StreamCanceller canceller;

    // Callers hold `mutex`.
    bool stopped() const { return cancelled || failed; }

    DownloadProgress snapshot() const {
        DownloadProgress p;
        p.infohash = infohash;
        p.file_name = manifest.file_name;
        p.state = state;
        p.completed_chunks = completed;
        p.total_chunks = manifest.chunk_count();
        if (state == DownloadState::Completed) {
            p.fraction = 1.0;
        } else if (p.total_chunks > 0) {
            p.fraction = static_cast<double>(completed) / p.total_chunks;
        }
        p.message = message;
        return p;
    }
};

DownloadManager::DownloadManager(PeerDiscovery& discovery, PeerClient& client, ContentStore& store,
                                 DownloadOptions options)
    : discovery_(discovery),
      client_(client),
      store_(store),
      options_(options),
      pool_(options.max_concurrent_fetches == 0 ? 1 : options.max_concurrent_fetches) {}

DownloadManager::~DownloadManager() {
    shutdown();
}

bool DownloadManager::start_download(const Manifest& manifest, const std::string& infohash, ProgressSink sink) {
    try {
        manifest.validate();
        if (!Hasher::is_hex_digest(infohash) || Hasher::info_hash(manifest) != infohash) {
            LOG_WARN("Refusing download of ", manifest.file_name, ": manifest does not match infohash ", infohash);
            return false;
        }
    } catch (const ProtocolError& e) {
        LOG_WARN("Refusing download of ", infohash, ": ", e.what());
        return false;
    }

    join_retired();

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_) {
        LOG_WARN("Download manager is shutting down; not starting ", infohash);
        return false;
    }
    if (tasks_.count(infohash)) {
        LOG_WARN("Download for ", infohash, " is already active");
        return false;
    }

    auto task = std::make_shared<DownloadTask>();
    task->infohash = infohash;
    task->manifest = manifest;
    task->sink = std::move(sink);
    tasks_[infohash] = task;
    ++running_;
    // Assigned under mutex_: the runner takes mutex_ before it hands its thread to retired_.
    task->runner = std::thread([this, task]() { run_task(task); });

    LOG_INFO("Starting download of ", manifest.file_name, " (", manifest.chunk_count(), " chunks) ", infohash);
    return true;
}

bool DownloadManager::pause_download(const std::string& infohash) {
    std::shared_ptr<DownloadTask> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(infohash);
        if (it != tasks_.end()) task = it->second;
    }
    if (!task) {
        LOG_WARN("Cannot pause ", infohash, ": no active download");
        return false;
    }

    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(task->mutex);
        if (task->stopped() || is_terminal(task->state)) {
            LOG_WARN("Cannot pause ", infohash, ": download is finishing");
            return false;
        }
        if (!task->paused) {
            task->paused = true;
            if (task->state == DownloadState::Downloading) {
                task->state = DownloadState::Paused;
                changed = true;
            }
        }
    }
    LOG_INFO("Paused download ", infohash);
    if (changed) emit(task);
    return true;
}

bool DownloadManager::resume_download(const std::string& infohash) {
    std::shared_ptr<DownloadTask> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(infohash);
        if (it != tasks_.end()) task = it->second;
    }
    if (!task) {
        LOG_WARN("Cannot resume ", infohash, ": no active download");
        return false;
    }

    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(task->mutex);
        if (task->stopped() || is_terminal(task->state)) {
            LOG_WARN("Cannot resume ", infohash, ": download is finishing");
            return false;
        }
        task->paused = false;
        if (task->state == DownloadState::Paused) {
            task->state = DownloadState::Downloading;
            changed = true;
        }
    }
    task->wake.notify_all();
    LOG_INFO("Resumed download ", infohash);
    if (changed) emit(task);
    return true;
}

bool DownloadManager::cancel_download(const std::string& infohash) {
    std::shared_ptr<DownloadTask> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(infohash);
        if (it != tasks_.end()) task = it->second;
    }
    if (!task) {
        LOG_WARN("Cannot cancel ", infohash, ": no active download");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(task->mutex);
        if (task->stopped() || is_terminal(task->state)) {
            LOG_WARN("Cannot cancel ", infohash, ": download is finishing");
            return false;
        }
        task->cancelled = true;
    }
    task->wake.notify_all();
    task->canceller.cancel();
    LOG_INFO("Cancelling download ", infohash);
    return true;
}

std::optional<DownloadProgress> DownloadManager::get_progress(const std::string& infohash) const {
    std::shared_ptr<DownloadTask> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(infohash);
        if (it == tasks_.end()) return std::nullopt;
        task = it->second;
    }
    std::lock_guard<std::mutex> lock(task->mutex);
    return task->snapshot();
}

std::vector<DownloadProgress> DownloadManager::active_downloads() const {
    std::vector<std::shared_ptr<DownloadTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [infohash, task] : tasks_) {
            tasks.push_back(task);
        }
    }
    std::vector<DownloadProgress> result;
    for (const auto& task : tasks) {
        std::lock_guard<std::mutex> lock(task->mutex);
        result.push_back(task->snapshot());
    }
    return result;
}

void DownloadManager::shutdown() {
    std::vector<std::shared_ptr<DownloadTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
        for (const auto& [infohash, task] : tasks_) {
            tasks.push_back(task);
        }
    }
    for (const auto& task : tasks) {
        {
            std::lock_guard<std::mutex> lock(task->mutex);
            if (!task->stopped()) task->cancelled = true;
        }
        task->wake.notify_all();
        task->canceller.cancel();
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        runners_done_.wait(lock, [this] { return running_ == 0; });
    }
    join_retired();
    pool_.join();
}

void DownloadManager::join_retired() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        done.swap(retired_);
    }
    for (auto& t : done) {
        if (t.joinable()) t.join();
    }
}

void DownloadManager::emit(const std::shared_ptr<DownloadTask>& task, bool final_report) {
    if (!task->sink) return;
    std::lock_guard<std::mutex> sink_lock(task->sink_mutex);
    DownloadProgress progress;
    {
        std::lock_guard<std::mutex> lock(task->mutex);
        progress = task->snapshot();
    }
    // Only finish() reports a terminal state, exactly once.
    if (is_terminal(progress.state) && !final_report) return;
    try {
        task->sink(progress);
    } catch (const std::exception& e) {
        LOG_ERR("Progress callback for ", task->infohash, " threw: ", e.what());
    }
}

void DownloadManager::set_state(const std::shared_ptr<DownloadTask>& task, DownloadState state) {
    {
        std::lock_guard<std::mutex> lock(task->mutex);
        if (state == DownloadState::Downloading && task->paused) {
            state = DownloadState::Paused;
        }
        task->state = state;
    }
    LOG_DEBUG("Download ", task->infohash, " is ", download_state_name(state));
    emit(task);
}

void DownloadManager::finish(const std::shared_ptr<DownloadTask>& task, DownloadState state, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(task->mutex);
        task->state = state;
        task->message = message;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.erase(task->infohash);
    }

    if (state == DownloadState::Completed) {
        LOG_INFO("Download of ", task->manifest.file_name, " completed: ", message);
    } else if (state == DownloadState::Cancelled) {
        LOG_INFO("Download of ", task->manifest.file_name, " cancelled");
    } else {
        LOG_WARN("Download of ", task->manifest.file_name, " failed: ", message);
    }

    if (state != DownloadState::Completed && options_.cleanup_partial_chunks) {
        try {
            store_.remove_chunk_dir(task->infohash);
        } catch (const IOError& e) {
            LOG_WARN("Could not remove partial chunks: ", e.what());
        }
    }
    emit(task, true);
}

bool DownloadManager::wait_while_paused(const std::shared_ptr<DownloadTask>& task) {
    std::unique_lock<std::mutex> lock(task->mutex);
    while (task->paused && !task->stopped()) {
        task->wake.wait_for(lock, options_.pause_poll_interval);
    }
    return !task->stopped();
}

void DownloadManager::run_task(const std::shared_ptr<DownloadTask>& task) {
    set_state(task, DownloadState::FindingPeers);

    std::vector<PeerEndpoint> peers;
    std::string failure;
    try {
        peers = discovery_.find_peers(task->infohash);
        if (peers.empty()) {
            failure = "no peers found";
        }
    } catch (const std::exception& e) {
        failure = std::string("peer discovery failed: ") + e.what();
    }

    if (failure.empty()) {
        try {
            store_.prepare_chunk_dir(task->infohash);
        } catch (const IOError& e) {
            failure = e.what();
        }
    }

    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lock(task->mutex);
        cancelled = task->cancelled;
    }

    if (cancelled) {
        finish(task, DownloadState::Cancelled, "cancelled");
    } else if (!failure.empty()) {
        finish(task, DownloadState::Failed, failure);
    } else {
        LOG_DEBUG("Found ", peers.size(), " peer(s) for ", task->infohash);
        download_chunks(task, peers);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    retired_.push_back(std::move(task->runner));
    --running_;
    runners_done_.notify_all();
}

void DownloadManager::download_chunks(const std::shared_ptr<DownloadTask>& task, const std::vector<PeerEndpoint>& peers) {
    set_state(task, DownloadState::Downloading);

    const uint32_t total = task->manifest.chunk_count();
    uint32_t next = 0;
    while (next < total) {
        if (!wait_while_paused(task)) break;
        if (!pool_.acquire_slot_for(options_.pause_poll_interval)) continue;

        // The flags may have changed while waiting for the slot.
        bool dispatch = false;
        {
            std::lock_guard<std::mutex> lock(task->mutex);
            if (!task->stopped() && !task->paused) {
                ++task->in_flight;
                dispatch = true;
            }
        }
        if (!dispatch) {
            pool_.release_slot();
            continue;
        }

        uint32_t index = next++;
        pool_.dispatch([this, task, peers, index]() { fetch_chunk(task, peers, index); });
    }

    // Wait for dispatched fetches; a cancel or failure ends the task without them.
    bool cancelled = false;
    bool failed = false;
    std::string message;
    {
        std::unique_lock<std::mutex> lock(task->mutex);
        task->wake.wait(lock, [&task] { return task->in_flight == 0 || task->stopped(); });
        cancelled = task->cancelled;
        failed = task->failed;
        message = task->message;
    }

    if (cancelled) {
        finish(task, DownloadState::Cancelled, "cancelled");
        return;
    }
    if (failed) {
        finish(task, DownloadState::Failed, message);
        return;
    }

    set_state(task, DownloadState::Reassembling);
    try {
        auto output = store_.reassemble(task->manifest, task->infohash);
        try {
            store_.remove_chunk_dir(task->infohash);
        } catch (const IOError& e) {
            LOG_WARN("Could not remove chunk directory: ", e.what());
        }
        finish(task, DownloadState::Completed, output.string());
    } catch (const IOError& e) {
        finish(task, DownloadState::Failed, e.what());
    }
}

void DownloadManager::fetch_chunk(const std::shared_ptr<DownloadTask>& task, const std::vector<PeerEndpoint>& peers, uint32_t index) {
    const Manifest& manifest = task->manifest;
    const std::string& expected = manifest.chunk_hashes[index];
    const size_t length = static_cast<size_t>(manifest.chunk_length(index));

    std::optional<std::vector<uint8_t>> data;
    for (const auto& peer : peers) {
        {
            std::lock_guard<std::mutex> lock(task->mutex);
            if (task->stopped()) break;
        }
        try {
            auto received = client_.fetch_chunk(peer, task->infohash, index, length, &task->canceller);
            if (Hasher::content_hash(received) != expected) {
                throw IntegrityError("hash mismatch");
            }
            data = std::move(received);
            break;
        } catch (const std::exception& e) {
            LOG_DEBUG("Chunk ", index, " of ", task->infohash, " from ", peer.to_string(), " failed: ", e.what());
        }
    }

    std::string write_error;
    bool stopped = false;
    {
        std::lock_guard<std::mutex> lock(task->mutex);
        stopped = task->stopped();
    }
    if (data && !stopped) {
        try {
            store_.write_chunk(task->infohash, index, *data);
        } catch (const IOError& e) {
            write_error = e.what();
        }
    }

    bool progressed = false;
    bool failed_now = false;
    {
        std::lock_guard<std::mutex> lock(task->mutex);
        if (!task->stopped()) {
            if (!write_error.empty()) {
                task->failed = true;
                task->message = write_error;
            } else if (!data) {
                task->failed = true;
                task->message = "could not download chunk " + std::to_string(index) + " from any peer";
            } else {
                ++task->completed;
                progressed = true;
            }
            failed_now = task->failed;
        }
    }
    if (failed_now) task->canceller.cancel();
    // Report before releasing in_flight so the runner cannot move on past this chunk first.
    if (progressed) emit(task);

    {
        std::lock_guard<std::mutex> lock(task->mutex);
        --task->in_flight;
    }
    task->wake.notify_all();
}
