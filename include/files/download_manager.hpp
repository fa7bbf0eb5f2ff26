#ifndef RIFT_DOWNLOAD_MANAGER_HPP
#define RIFT_DOWNLOAD_MANAGER_HPP

#include "manifest.hpp"
#include "content_store.hpp"
#include "../common/worker_pool.hpp"
#include "../discovery/peer_discovery.hpp"
#include "../network/peer_client.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

enum class DownloadState {
    Pending,
    FindingPeers,
    Downloading,
    Paused,
    Reassembling,
    Completed,
    Cancelled,
    Failed
};

const char* download_state_name(DownloadState state);
bool is_terminal(DownloadState state);

struct DownloadProgress {
    std::string infohash;
    std::string file_name;
    DownloadState state = DownloadState::Pending;
    uint32_t completed_chunks = 0;
    uint32_t total_chunks = 0;
    double fraction = 0.0;
    std::string message;     // failure reason, or the output path once completed
};

// Called on every state change and chunk completion, from the task's own threads.
using ProgressSink = std::function<void(const DownloadProgress&)>;

struct DownloadOptions {
    size_t max_concurrent_fetches = 10;
    std::chrono::milliseconds pause_poll_interval{200};
    bool cleanup_partial_chunks = false;  // drop chunk blobs of cancelled and failed tasks
};

/**
 * Runs downloads. Each task gets a runner thread that finds peers and dispatches one fetch per
 * chunk, in index order, to a WorkerPool shared by all tasks. Chunks are verified against the
 * manifest before they are written. Control operations never throw; a task's outcome is
 * reported through its terminal state and message.
 */
class DownloadManager {
public:
    DownloadManager(PeerDiscovery& discovery, PeerClient& client, ContentStore& store,
                    DownloadOptions options = DownloadOptions());
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    /**
     * @brief Starts downloading the content described by manifest.
     * @return false if the manifest is invalid, does not hash to infohash, or a download for
     *         infohash is already active.
     */
    bool start_download(const Manifest& manifest, const std::string& infohash, ProgressSink sink = nullptr);

    // Returns false for unknown or already finished downloads.
    bool pause_download(const std::string& infohash);
    bool resume_download(const std::string& infohash);
    // Also aborts the task's in-flight chunk requests so their pool slots free up.
    bool cancel_download(const std::string& infohash);

    std::optional<DownloadProgress> get_progress(const std::string& infohash) const;
    std::vector<DownloadProgress> active_downloads() const;

    // Cancels every active download and joins all threads.
    void shutdown();

private:
    struct DownloadTask;

    void run_task(const std::shared_ptr<DownloadTask>& task);
    void download_chunks(const std::shared_ptr<DownloadTask>& task, const std::vector<PeerEndpoint>& peers);
    void fetch_chunk(const std::shared_ptr<DownloadTask>& task, const std::vector<PeerEndpoint>& peers, uint32_t index);
    bool wait_while_paused(const std::shared_ptr<DownloadTask>& task);
    void set_state(const std::shared_ptr<DownloadTask>& task, DownloadState state);
    void finish(const std::shared_ptr<DownloadTask>& task, DownloadState state, const std::string& message);
    void emit(const std::shared_ptr<DownloadTask>& task, bool final_report = false);
    void join_retired();

    PeerDiscovery& discovery_;
    PeerClient& client_;
    ContentStore& store_;
    DownloadOptions options_;
    WorkerPool pool_;

    mutable std::mutex mutex_;
    std::condition_variable runners_done_;
    std::map<std::string, std::shared_ptr<DownloadTask>> tasks_;
    std::vector<std::thread> retired_;
    size_t running_ = 0;
    bool shutting_down_ = false;
};

#endif //RIFT_DOWNLOAD_MANAGER_HPP
