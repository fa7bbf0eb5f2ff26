#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "files/download_manager.hpp"
#include "files/content_store.hpp"
#include "network/peer_client.hpp"
#include "network/upload_server.hpp"
#include "discovery/static_peer_discovery.hpp"
#include "storage/storage_manager.hpp"
#include "crypto/hasher.hpp"
#include "common/serializer.hpp"
#include "common/errors.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <thread>

using namespace test_support;
using ::testing::Return;
using ::testing::Throw;

namespace {
    constexpr uint32_t CS = 1024;

    std::string metadata_request(const std::string& infohash) {
        return "GET_RIFT\n" + infohash + "\n";
    }

    std::string chunk_request(const std::string& infohash, uint32_t index) {
        return infohash + "\n" + std::to_string(index) + "\n";
    }

    // Manifest and chunk bytes for in-memory content.
    Manifest manifest_for(const std::string& name, const std::string& content, uint32_t chunk_size,
                          std::map<uint32_t, std::vector<uint8_t>>* chunks = nullptr) {
        Manifest m;
        m.file_name = name;
        m.total_size = content.size();
        m.chunk_size = chunk_size;
        for (uint32_t i = 0; i < Manifest::expected_chunk_count(content.size(), chunk_size); ++i) {
            std::string span = content.substr(m.chunk_offset(i), chunk_size);
            m.chunk_hashes.push_back(Hasher::content_hash(span));
            if (chunks) (*chunks)[i] = std::vector<uint8_t>(span.begin(), span.end());
        }
        return m;
    }

    template<typename Pred>
    bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!pred()) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return true;
    }
}

// A node holding content, served in memory through its UploadServer.
struct PeerNode {
    TempDir dir;
    StorageManager storage;
    ContentStore store;
    UploadServer server;

    PeerNode(Transport& transport, uint32_t chunk_size)
        : storage((dir / "index.db").string()),
          store(dir / "shared", dir / "downloads", storage, chunk_size),
          server(transport, store, 0, 2, std::chrono::milliseconds(500)) {}

    Manifest share(const std::string& name, const std::string& content) {
        fs::path source = dir / name;
        write_file(source, content);
        return store.share_file(source);
    }
};

// Peer client whose chunk fetches block until the test opens the gate. A blocked fetch gives
// up once its canceller aborts it, the way a real request's stream would.
class GatedPeerClient : public PeerClient {
public:
    GatedPeerClient(Transport& transport, std::map<uint32_t, std::vector<uint8_t>> chunks)
        : PeerClient(transport), chunks_(std::move(chunks)) {}

    // Serves `chunks` for `infohash` instead of the constructor's content.
    void add_content(const std::string& infohash, std::map<uint32_t, std::vector<uint8_t>> chunks) {
        std::lock_guard<std::mutex> lock(mutex_);
        content_[infohash] = std::move(chunks);
    }

    std::vector<uint8_t> fetch_chunk(const PeerEndpoint&, const std::string& infohash, uint32_t index, size_t,
                                     StreamCanceller* canceller) override {
        MemoryStream gate("");
        StreamCanceller::Guard guard(canceller, gate);

        std::unique_lock<std::mutex> lock(mutex_);
        calls_.push_back(index);
        peak_active_ = std::max(peak_active_, ++active_);
        cv_.notify_all();
        while (!open_ && !gate.exchange()->is_aborted()) {
            cv_.wait_for(lock, std::chrono::milliseconds(5));
        }
        --active_;
        if (!open_) {
            throw NetworkError("aborted");
        }
        auto it = content_.find(infohash);
        return it != content_.end() ? it->second.at(index) : chunks_.at(index);
    }

    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    bool wait_for_calls(size_t n) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::seconds(5), [this, n] { return calls_.size() >= n; });
    }

    std::vector<uint32_t> calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    // Most fetches ever blocked in the gate at the same time.
    size_t peak_active() {
        std::lock_guard<std::mutex> lock(mutex_);
        return peak_active_;
    }

private:
    std::map<uint32_t, std::vector<uint8_t>> chunks_;
    std::map<std::string, std::map<uint32_t, std::vector<uint8_t>>> content_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<uint32_t> calls_;
    size_t active_ = 0;
    size_t peak_active_ = 0;
    bool open_ = false;
};

class UploadServerTest : public ::testing::Test {
protected:
    FakeTransport transport_;
    PeerNode node_{transport_, CS};
};

TEST_F(UploadServerTest, ServesManifestAndChunks) {
    std::string content = pattern_bytes(2 * CS + 10);
    Manifest m = node_.share("clip.mp4", content);
    std::string infohash = Hasher::info_hash(m);

    EXPECT_EQ(serve_request(node_.server, metadata_request(infohash)), Serializer::serialize_manifest(m));
    EXPECT_EQ(serve_request(node_.server, chunk_request(infohash, 0)), content.substr(0, CS));
    EXPECT_EQ(serve_request(node_.server, chunk_request(infohash, 2)), content.substr(2 * CS));

    // Carriage returns before the line feeds are tolerated.
    EXPECT_EQ(serve_request(node_.server, infohash + "\r\n1\r\n"), content.substr(CS, CS));
}

TEST_F(UploadServerTest, UnsatisfiableRequestsGetNothing) {
    Manifest m = node_.share("doc.pdf", pattern_bytes(CS));
    std::string infohash = Hasher::info_hash(m);
    std::string unknown(64, '0');

    EXPECT_EQ(serve_request(node_.server, metadata_request(unknown)), "");
    EXPECT_EQ(serve_request(node_.server, chunk_request(unknown, 0)), "");
    EXPECT_EQ(serve_request(node_.server, chunk_request(infohash, 1)), "");
}

TEST_F(UploadServerTest, MalformedRequestsAreDropped) {
    Manifest m = node_.share("doc.pdf", pattern_bytes(CS));
    std::string infohash = Hasher::info_hash(m);

    const std::vector<std::string> bad = {
        "",
        "GET_RIFT\n",
        "GET_RIFT\nnot-a-hash\n",
        infohash + "\n-1\n",
        infohash + "\nabc\n",
        infohash + "\n99999999999\n",
        std::string(300, 'a') + "\n0\n",
        "GET_RIFT\n" + infohash + std::string(200, '0') + "\n",
    };
    for (const auto& request : bad) {
        MemoryStream stream(request);
        node_.server.handle_connection(stream);
        EXPECT_EQ(stream.exchange()->output_string(), "") << request;
        EXPECT_TRUE(stream.exchange()->closed);
    }
}

TEST_F(UploadServerTest, HeaderLineLimit) {
    // 255 bytes plus the terminator fit; one more does not.
    std::string max_line(255, 'x');
    MemoryStream ok(max_line + "\n");
    EXPECT_EQ(ok.read_line(MAX_HEADER_LINE), max_line);

    MemoryStream too_long(std::string(256, 'x') + "\n");
    EXPECT_THROW(too_long.read_line(MAX_HEADER_LINE), ProtocolError);
}

TEST_F(UploadServerTest, AcceptsConnectionsUntilStopped) {
    Manifest m = node_.share("song.ogg", pattern_bytes(CS / 2));
    std::string infohash = Hasher::info_hash(m);

    node_.server.start();
    ASSERT_TRUE(node_.server.is_running());
    EXPECT_EQ(node_.server.port(), 40000);

    auto first = transport_.connect_to_listener(metadata_request(infohash));
    auto second = transport_.connect_to_listener(chunk_request(infohash, 0));
    ASSERT_TRUE(first->wait_closed());
    ASSERT_TRUE(second->wait_closed());
    EXPECT_EQ(first->output_string(), Serializer::serialize_manifest(m));
    EXPECT_EQ(second->output_string().size(), CS / 2);

    node_.server.stop();
    EXPECT_FALSE(node_.server.is_running());
    EXPECT_EQ(node_.server.port(), 0);
}

class PeerClientTest : public ::testing::Test {
protected:
    FakeTransport transport_;
    PeerNode node_{transport_, CS};
    PeerClient client_{transport_};
    PeerEndpoint peer_{"10.0.0.1", 4001};

    void SetUp() override {
        transport_.serve_from(peer_, node_.server);
    }
};

TEST_F(PeerClientTest, FetchesAndVerifiesManifest) {
    Manifest m = node_.share("a.bin", pattern_bytes(3 * CS));
    std::string infohash = Hasher::info_hash(m);

    auto fetched = client_.fetch_manifest(peer_, infohash);
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(*fetched, m);
    EXPECT_EQ(transport_.requests_to(peer_, metadata_request(infohash)), 1u);
}

TEST_F(PeerClientTest, UnknownManifestIsNotFound) {
    EXPECT_FALSE(client_.fetch_manifest(peer_, std::string(64, 'b')).has_value());
    EXPECT_FALSE(client_.find_manifest({peer_}, std::string(64, 'b')).has_value());
}

TEST_F(PeerClientTest, RejectsWrongOrBrokenManifest) {
    Manifest m = node_.share("a.bin", pattern_bytes(CS));
    std::string encoded = Serializer::serialize_manifest(m);

    PeerEndpoint liar{"10.0.0.66", 4001};
    transport_.add_peer(liar, [encoded](const std::string&) { return encoded; });
    EXPECT_THROW(client_.fetch_manifest(liar, std::string(64, 'c')), IntegrityError);

    PeerEndpoint garbled{"10.0.0.67", 4001};
    transport_.add_peer(garbled, [](const std::string&) { return std::string("{\"oops\":"); });
    EXPECT_THROW(client_.fetch_manifest(garbled, std::string(64, 'c')), ProtocolError);
}

TEST_F(PeerClientTest, FindManifestSkipsFailingPeers) {
    Manifest m = node_.share("a.bin", pattern_bytes(CS));
    std::string infohash = Hasher::info_hash(m);

    PeerEndpoint unreachable{"10.0.0.99", 4001};
    auto found = client_.find_manifest({unreachable, peer_}, infohash);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, m);
}

TEST_F(PeerClientTest, ChunkFetchErrors) {
    Manifest m = node_.share("a.bin", pattern_bytes(CS + 1));
    std::string infohash = Hasher::info_hash(m);

    EXPECT_EQ(client_.fetch_chunk(peer_, infohash, 1, 1).size(), 1u);
    EXPECT_THROW(client_.fetch_chunk(peer_, infohash, 2, CS), NetworkError);
    EXPECT_THROW(client_.fetch_chunk(peer_, infohash, 0, CS - 1), ProtocolError);
    EXPECT_THROW(client_.fetch_chunk({"10.0.0.99", 4001}, infohash, 0, CS), NetworkError);
}

class DownloadManagerTest : public ::testing::Test {
protected:
    FakeTransport transport_;
    TempDir dir_;
    StorageManager storage_{(dir_ / "index.db").string()};
    ContentStore store_{dir_ / "shared", dir_ / "downloads", storage_, CS};
    PeerEndpoint peer_a_{"10.0.0.1", 4001};
    PeerEndpoint peer_b_{"10.0.0.2", 4001};

    DownloadOptions options(size_t fetches = 4, bool cleanup = false) {
        DownloadOptions o;
        o.max_concurrent_fetches = fetches;
        o.pause_poll_interval = std::chrono::milliseconds(20);
        o.cleanup_partial_chunks = cleanup;
        return o;
    }
};

TEST_F(DownloadManagerTest, CompletesFromSinglePeer) {
    PeerNode seeder(transport_, CS);
    std::string content = pattern_bytes(5 * CS + 123);
    Manifest m = seeder.share("archive.tar", content);
    std::string infohash = Hasher::info_hash(m);
    transport_.serve_from(peer_a_, seeder.server);

    StaticPeerDiscovery discovery({peer_a_});
    PeerClient client(transport_);
    ProgressRecorder recorder;
    DownloadManager manager(discovery, client, store_, options());

    ASSERT_TRUE(manager.start_download(m, infohash, recorder.sink()));
    auto final_report = recorder.wait_terminal();
    ASSERT_TRUE(final_report.has_value());
    ASSERT_EQ(final_report->state, DownloadState::Completed) << final_report->message;
    EXPECT_DOUBLE_EQ(final_report->fraction, 1.0);
    EXPECT_EQ(final_report->completed_chunks, 6u);
    EXPECT_EQ(fs::path(final_report->message), dir_ / "downloads" / "archive.tar");

    EXPECT_EQ(read_file(dir_ / "downloads" / "archive.tar"), content);
    EXPECT_FALSE(fs::exists(store_.chunk_dir(infohash)));
    EXPECT_EQ(recorder.terminal_count(), 1u);

    uint32_t last = 0;
    for (const auto& p : recorder.reports()) {
        EXPECT_GE(p.completed_chunks, last);
        last = p.completed_chunks;
        EXPECT_EQ(p.total_chunks, 6u);
    }

    EXPECT_FALSE(manager.get_progress(infohash).has_value());
    EXPECT_TRUE(manager.active_downloads().empty());
    EXPECT_FALSE(manager.pause_download(infohash));
}

TEST_F(DownloadManagerTest, CorruptPeerFallsBackToNextPeer) {
    PeerNode honest(transport_, CS);
    std::string content = pattern_bytes(3 * CS + 1);
    Manifest m = honest.share("image.iso", content);
    std::string infohash = Hasher::info_hash(m);

    transport_.add_peer(peer_a_, [&honest](const std::string& request) {
        std::string response = serve_request(honest.server, request);
        if (request.rfind("GET_RIFT", 0) != 0 && !response.empty()) {
            response[0] = static_cast<char>(response[0] ^ 0x5a);
        }
        return response;
    });
    transport_.serve_from(peer_b_, honest.server);

    StaticPeerDiscovery discovery({peer_a_, peer_b_});
    PeerClient client(transport_);
    ProgressRecorder recorder;
    DownloadManager manager(discovery, client, store_, options());

    ASSERT_TRUE(manager.start_download(m, infohash, recorder.sink()));
    auto final_report = recorder.wait_terminal();
    ASSERT_TRUE(final_report.has_value());
    ASSERT_EQ(final_report->state, DownloadState::Completed) << final_report->message;

    EXPECT_EQ(read_file(dir_ / "downloads" / "image.iso"), content);
    for (uint32_t i = 0; i < m.chunk_count(); ++i) {
        EXPECT_EQ(transport_.requests_to(peer_a_, chunk_request(infohash, i)), 1u);
        EXPECT_EQ(transport_.requests_to(peer_b_, chunk_request(infohash, i)), 1u);
    }
}

TEST_F(DownloadManagerTest, FailsWhenNoPeerHasAChunk) {
    PeerNode seeder(transport_, CS);
    Manifest m = seeder.share("lost.bin", pattern_bytes(2 * CS));
    std::string infohash = Hasher::info_hash(m);

    // Peer A knows nothing about the content, peer B refuses connections.
    PeerNode empty(transport_, CS);
    transport_.serve_from(peer_a_, empty.server);

    StaticPeerDiscovery discovery({peer_a_, peer_b_});
    PeerClient client(transport_);
    ProgressRecorder recorder;
    DownloadManager manager(discovery, client, store_, options());

    ASSERT_TRUE(manager.start_download(m, infohash, recorder.sink()));
    auto final_report = recorder.wait_terminal();
    ASSERT_TRUE(final_report.has_value());
    EXPECT_EQ(final_report->state, DownloadState::Failed);
    EXPECT_NE(final_report->message.find("from any peer"), std::string::npos) << final_report->message;

    EXPECT_FALSE(fs::exists(dir_ / "downloads" / "lost.bin"));
    EXPECT_EQ(recorder.terminal_count(), 1u);
    EXPECT_FALSE(manager.cancel_download(infohash));
}

TEST_F(DownloadManagerTest, FailsWithoutPeers) {
    std::string content = pattern_bytes(CS);
    Manifest m = manifest_for("alone.bin", content, CS);
    std::string infohash = Hasher::info_hash(m);

    MockPeerDiscovery discovery;
    EXPECT_CALL(discovery, find_peers(infohash)).WillOnce(Return(std::vector<PeerEndpoint>{}));
    EXPECT_CALL(discovery, announce(::testing::_)).Times(0);

    PeerClient client(transport_);
    ProgressRecorder recorder;
    DownloadManager manager(discovery, client, store_, options());

    ASSERT_TRUE(manager.start_download(m, infohash, recorder.sink()));
    auto final_report = recorder.wait_terminal();
    ASSERT_TRUE(final_report.has_value());
    EXPECT_EQ(final_report->state, DownloadState::Failed);
    EXPECT_EQ(final_report->message, "no peers found");
}

TEST_F(DownloadManagerTest, FailsWhenDiscoveryThrows) {
    Manifest m = manifest_for("alone.bin", pattern_bytes(CS), CS);
    std::string infohash = Hasher::info_hash(m);

    MockPeerDiscovery discovery;
    EXPECT_CALL(discovery, find_peers(infohash)).WillOnce(Throw(std::runtime_error("directory offline")));

    PeerClient client(transport_);
    ProgressRecorder recorder;
    DownloadManager manager(discovery, client, store_, options());

    ASSERT_TRUE(manager.start_download(m, infohash, recorder.sink()));
    auto final_report = recorder.wait_terminal();
    ASSERT_TRUE(final_report.has_value());
    EXPECT_EQ(final_report->state, DownloadState::Failed);
    EXPECT_EQ(final_report->message, "peer discovery failed: directory offline");
}

TEST_F(DownloadManagerTest, PauseStopsDispatchUntilResumed) {
    std::map<uint32_t, std::vector<uint8_t>> chunks;
    std::string content = pattern_bytes(8 * CS);
    Manifest m = manifest_for("paused.bin", content, CS, &chunks);
    std::string infohash = Hasher::info_hash(m);

    StaticPeerDiscovery discovery({peer_a_});
    GatedPeerClient client(transport_, chunks);
    ProgressRecorder recorder;
    DownloadManager manager(discovery, client, store_, options(2));

    ASSERT_TRUE(manager.start_download(m, infohash, recorder.sink()));
    ASSERT_TRUE(client.wait_for_calls(2));

    // Both slots are taken, so nothing else can have been dispatched yet.
    ASSERT_TRUE(manager.pause_download(infohash));
    client.open();
    ASSERT_TRUE(wait_until([&] {
        auto p = manager.get_progress(infohash);
        return p && p->completed_chunks == 2;
    }));

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    EXPECT_EQ(client.calls().size(), 2u);
    auto paused = manager.get_progress(infohash);
    ASSERT_TRUE(paused.has_value());
    EXPECT_EQ(paused->state, DownloadState::Paused);
    EXPECT_DOUBLE_EQ(paused->fraction, 0.25);

    ASSERT_TRUE(manager.resume_download(infohash));
    auto final_report = recorder.wait_terminal();
    ASSERT_TRUE(final_report.has_value());
    ASSERT_EQ(final_report->state, DownloadState::Completed) << final_report->message;
    EXPECT_EQ(read_file(dir_ / "downloads" / "paused.bin"), content);

    auto calls = client.calls();
    std::sort(calls.begin(), calls.end());
    std::vector<uint32_t> expected(8);
    for (uint32_t i = 0; i < 8; ++i) expected[i] = i;
    EXPECT_EQ(calls, expected);
}

TEST_F(DownloadManagerTest, CancelEndsTaskWithoutOutput) {
    std::map<uint32_t, std::vector<uint8_t>> chunks;
    Manifest m = manifest_for("cancelled.bin", pattern_bytes(6 * CS), CS, &chunks);
    std::string infohash = Hasher::info_hash(m);

    StaticPeerDiscovery discovery({peer_a_});
    GatedPeerClient client(transport_, chunks);
    ProgressRecorder recorder;
    DownloadManager manager(discovery, client, store_, options(2));

    ASSERT_TRUE(manager.start_download(m, infohash, recorder.sink()));
    ASSERT_TRUE(client.wait_for_calls(2));

    ASSERT_TRUE(manager.cancel_download(infohash));
    auto final_report = recorder.wait_terminal();
    client.open();
    ASSERT_TRUE(final_report.has_value());
    EXPECT_EQ(final_report->state, DownloadState::Cancelled);

    EXPECT_FALSE(fs::exists(dir_ / "downloads" / "cancelled.bin"));
    EXPECT_FALSE(manager.cancel_download(infohash));
    EXPECT_FALSE(manager.resume_download(infohash));

    // Partial chunks are kept unless cleanup is enabled.
    EXPECT_TRUE(fs::exists(store_.chunk_dir(infohash)));
    EXPECT_EQ(recorder.terminal_count(), 1u);
}

TEST_F(DownloadManagerTest, CleanupRemovesPartialChunks) {
    std::map<uint32_t, std::vector<uint8_t>> chunks;
    Manifest m = manifest_for("cleaned.bin", pattern_bytes(6 * CS), CS, &chunks);
    std::string infohash = Hasher::info_hash(m);

    StaticPeerDiscovery discovery({peer_a_});
    GatedPeerClient client(transport_, chunks);
    ProgressRecorder recorder;
    DownloadManager manager(discovery, client, store_, options(2, true));

    ASSERT_TRUE(manager.start_download(m, infohash, recorder.sink()));
    ASSERT_TRUE(client.wait_for_calls(2));
    ASSERT_TRUE(manager.cancel_download(infohash));
    auto final_report = recorder.wait_terminal();
    client.open();
    ASSERT_TRUE(final_report.has_value());
    EXPECT_EQ(final_report->state, DownloadState::Cancelled);
    EXPECT_FALSE(fs::exists(store_.chunk_dir(infohash)));
}

TEST_F(DownloadManagerTest, MissingChunkOnFirstPeerComesFromSecond) {
    const uint32_t chunk_size = DEFAULT_CHUNK_SIZE;
    PeerNode seeder(transport_, chunk_size);
    std::string content = pattern_bytes(chunk_size * 5 / 2, 42);
    Manifest m = seeder.share("report.pdf", content);
    std::string infohash = Hasher::info_hash(m);
    ASSERT_EQ(m.chunk_count(), 3u);
    ASSERT_EQ(m.chunk_length(2), chunk_size / 2);

    const std::string missing = chunk_request(infohash, 1);
    transport_.add_peer(peer_a_, [&seeder, missing](const std::string& request) {
        return request == missing ? std::string() : serve_request(seeder.server, request);
    });
    transport_.serve_from(peer_b_, seeder.server);

    StaticPeerDiscovery discovery({peer_a_, peer_b_});
    PeerClient client(transport_);
    ProgressRecorder recorder;
    DownloadManager manager(discovery, client, store_, options());

    ASSERT_TRUE(manager.start_download(m, infohash, recorder.sink()));
    auto final_report = recorder.wait_terminal(std::chrono::seconds(30));
    ASSERT_TRUE(final_report.has_value());
    ASSERT_EQ(final_report->state, DownloadState::Completed) << final_report->message;
    EXPECT_EQ(final_report->completed_chunks, 3u);

    EXPECT_EQ(read_file(dir_ / "downloads" / "report.pdf"), content);
    EXPECT_EQ(transport_.requests_to(peer_a_, missing), 1u);
    EXPECT_EQ(transport_.requests_to(peer_b_, missing), 1u);
    EXPECT_EQ(transport_.requests_to(peer_b_, chunk_request(infohash, 0)), 0u);
    EXPECT_EQ(transport_.requests_to(peer_b_, chunk_request(infohash, 2)), 0u);
}

TEST_F(DownloadManagerTest, EmptyFileCompletes) {
    Manifest m = manifest_for("empty.txt", "", CS);
    std::string infohash = Hasher::info_hash(m);

    StaticPeerDiscovery discovery({peer_a_});
    PeerClient client(transport_);
    ProgressRecorder recorder;
    DownloadManager manager(discovery, client, store_, options());

    ASSERT_TRUE(manager.start_download(m, infohash, recorder.sink()));
    auto final_report = recorder.wait_terminal();
    ASSERT_TRUE(final_report.has_value());
    ASSERT_EQ(final_report->state, DownloadState::Completed) << final_report->message;
    EXPECT_DOUBLE_EQ(final_report->fraction, 1.0);
    ASSERT_TRUE(fs::exists(dir_ / "downloads" / "empty.txt"));
    EXPECT_EQ(fs::file_size(dir_ / "downloads" / "empty.txt"), 0u);
}

TEST_F(DownloadManagerTest, RejectsInvalidStarts) {
    std::map<uint32_t, std::vector<uint8_t>> chunks;
    Manifest m = manifest_for("dup.bin", pattern_bytes(4 * CS), CS, &chunks);
    std::string infohash = Hasher::info_hash(m);

    StaticPeerDiscovery discovery({peer_a_});
    GatedPeerClient client(transport_, chunks);
    DownloadManager manager(discovery, client, store_, options(1));

    EXPECT_FALSE(manager.start_download(m, std::string(64, 'd')));
    EXPECT_FALSE(manager.start_download(m, "short"));

    Manifest broken = m;
    broken.chunk_hashes.pop_back();
    EXPECT_FALSE(manager.start_download(broken, Hasher::info_hash(m)));

    EXPECT_FALSE(manager.pause_download(infohash));
    EXPECT_FALSE(manager.resume_download(infohash));
    EXPECT_FALSE(manager.cancel_download(infohash));

    ASSERT_TRUE(manager.start_download(m, infohash));
    EXPECT_FALSE(manager.start_download(m, infohash));
    ASSERT_EQ(manager.active_downloads().size(), 1u);
    EXPECT_EQ(manager.active_downloads()[0].infohash, infohash);

    client.open();
    ASSERT_TRUE(wait_until([&] { return !manager.get_progress(infohash).has_value(); }));
    EXPECT_TRUE(fs::exists(dir_ / "downloads" / "dup.bin"));
}

TEST_F(DownloadManagerTest, ShutdownCancelsActiveDownloads) {
    std::map<uint32_t, std::vector<uint8_t>> chunks;
    Manifest m = manifest_for("big.bin", pattern_bytes(4 * CS), CS, &chunks);
    std::string infohash = Hasher::info_hash(m);

    StaticPeerDiscovery discovery({peer_a_});
    GatedPeerClient client(transport_, chunks);
    ProgressRecorder recorder;
    DownloadManager manager(discovery, client, store_, options(1));

    ASSERT_TRUE(manager.start_download(m, infohash, recorder.sink()));
    ASSERT_TRUE(client.wait_for_calls(1));

    // The blocked fetch is aborted; the gate is never opened.
    auto started = std::chrono::steady_clock::now();
    manager.shutdown();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_EQ(client.calls().size(), 1u);

    auto final_report = recorder.wait_terminal(std::chrono::milliseconds(100));
    ASSERT_TRUE(final_report.has_value());
    EXPECT_EQ(final_report->state, DownloadState::Cancelled);
    EXPECT_FALSE(manager.start_download(m, infohash));
}

TEST_F(DownloadManagerTest, CancelFreesFetchSlotsForOtherDownloads) {
    std::map<uint32_t, std::vector<uint8_t>> chunks_a;
    std::map<uint32_t, std::vector<uint8_t>> chunks_b;
    Manifest a = manifest_for("stalled.bin", pattern_bytes(3 * CS, 1), CS, &chunks_a);
    std::string b_content = pattern_bytes(2 * CS, 2);
    Manifest b = manifest_for("next.bin", b_content, CS, &chunks_b);
    std::string a_hash = Hasher::info_hash(a);
    std::string b_hash = Hasher::info_hash(b);

    StaticPeerDiscovery discovery({peer_a_});
    GatedPeerClient client(transport_, chunks_a);
    client.add_content(b_hash, chunks_b);
    ProgressRecorder recorder_a;
    ProgressRecorder recorder_b;
    DownloadManager manager(discovery, client, store_, options(1));

    ASSERT_TRUE(manager.start_download(a, a_hash, recorder_a.sink()));
    ASSERT_TRUE(client.wait_for_calls(1));
    ASSERT_TRUE(manager.start_download(b, b_hash, recorder_b.sink()));

    // The only slot belongs to the blocked fetch of `a`.
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(client.calls().size(), 1u);

    ASSERT_TRUE(manager.cancel_download(a_hash));
    auto a_report = recorder_a.wait_terminal();
    ASSERT_TRUE(a_report.has_value());
    EXPECT_EQ(a_report->state, DownloadState::Cancelled);

    // Aborting the fetch of `a` released its slot without the gate opening.
    ASSERT_TRUE(client.wait_for_calls(2));

    client.open();
    auto b_report = recorder_b.wait_terminal();
    ASSERT_TRUE(b_report.has_value());
    ASSERT_EQ(b_report->state, DownloadState::Completed) << b_report->message;
    EXPECT_EQ(read_file(dir_ / "downloads" / "next.bin"), b_content);
    EXPECT_FALSE(fs::exists(dir_ / "downloads" / "stalled.bin"));
}

TEST_F(DownloadManagerTest, FetchSlotsAreSharedAcrossDownloads) {
    std::map<uint32_t, std::vector<uint8_t>> chunks_a;
    std::map<uint32_t, std::vector<uint8_t>> chunks_b;
    std::string a_content = pattern_bytes(4 * CS, 3);
    std::string b_content = pattern_bytes(4 * CS, 4);
    Manifest a = manifest_for("first.bin", a_content, CS, &chunks_a);
    Manifest b = manifest_for("second.bin", b_content, CS, &chunks_b);
    std::string a_hash = Hasher::info_hash(a);
    std::string b_hash = Hasher::info_hash(b);

    StaticPeerDiscovery discovery({peer_a_});
    GatedPeerClient client(transport_, chunks_a);
    client.add_content(b_hash, chunks_b);
    ProgressRecorder recorder_a;
    ProgressRecorder recorder_b;
    DownloadManager manager(discovery, client, store_, options(2));

    ASSERT_TRUE(manager.start_download(a, a_hash, recorder_a.sink()));
    ASSERT_TRUE(manager.start_download(b, b_hash, recorder_b.sink()));
    ASSERT_TRUE(client.wait_for_calls(2));

    // Two tasks, two slots in total: nothing else is dispatched while both are held.
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    EXPECT_EQ(client.calls().size(), 2u);
    EXPECT_EQ(client.peak_active(), 2u);

    client.open();
    auto a_report = recorder_a.wait_terminal();
    auto b_report = recorder_b.wait_terminal();
    ASSERT_TRUE(a_report.has_value());
    ASSERT_TRUE(b_report.has_value());
    ASSERT_EQ(a_report->state, DownloadState::Completed) << a_report->message;
    ASSERT_EQ(b_report->state, DownloadState::Completed) << b_report->message;

    EXPECT_EQ(client.calls().size(), 8u);
    EXPECT_LE(client.peak_active(), 2u);
    EXPECT_EQ(read_file(dir_ / "downloads" / "first.bin"), a_content);
    EXPECT_EQ(read_file(dir_ / "downloads" / "second.bin"), b_content);
}
