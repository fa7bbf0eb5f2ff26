#include <iostream>
#include <string>
#include <asio.hpp>
#include <csignal>
#include <filesystem>

#include "common/config.hpp"
#include "common/logger.hpp"
#include "crypto/certificate.hpp"
#include "storage/storage_manager.hpp"
#include "files/content_store.hpp"
#include "files/download_manager.hpp"
#include "discovery/static_peer_discovery.hpp"
#include "network/tls_transport.hpp"
#include "network/peer_client.hpp"
#include "network/upload_server.hpp"
#include "cli/cli.hpp"

namespace fs = std::filesystem;

void print_usage() {
    std::cout << "Usage: riftshare <mode> [config.json]\n"
              << "Modes:\n"
              << "  interactive [config]   - Run a node with the command line interface\n"
              << "  server [config]        - Run a headless node until SIGINT or SIGTERM\n";
}

int main(int argc, char* argv[]) {
    std::string mode = "interactive";
    if (argc > 1) {
        mode = argv[1];
    }
    if ((mode != "interactive" && mode != "server") || argc > 3) {
        print_usage();
        return 1;
    }

    try {
        Config config;
        if (argc > 2) {
            config = Config::load(argv[2]);
        }
        config.resolve_paths();
        fs::create_directories(config.data_dir);

        Logger::instance().init(config.log_file);
        Logger::instance().set_level(Logger::level_from_string(config.log_level));
        if (mode == "interactive") {
            // Keep the prompt readable; the log file gets everything.
            Logger::instance().set_console_output(false);
        }
        LOG_INFO("Starting RiftShare node (", mode, " mode)...");

        if (Certificate::ensure_self_signed_certificate(config.cert_file, config.key_file, "riftshare")) {
            LOG_INFO("Generated self-signed certificate ", config.cert_file);
        }

        // 1. Setup Storage
        StorageManager storage_manager(config.db_path);
        ContentStore store(config.shared_dir, config.downloads_dir, storage_manager, config.chunk_size);
        size_t shared = store.rescan();
        LOG_INFO("Indexed ", shared, " shared file(s) in ", config.shared_dir);

        // 2. Discovery: configured seeds, and this node as the holder of everything it shares
        StaticPeerDiscovery discovery(config.peers, PeerEndpoint{"127.0.0.1", config.port});
        for (const auto& s : store.list_shared_manifests()) {
            discovery.announce(s.infohash);
        }

        // 3. Transport and upload server
        TlsOptions tls;
        tls.cert_file = config.cert_file;
        tls.key_file = config.key_file;
        tls.ca_file = config.ca_file;
        tls.io_timeout = config.io_timeout;
        TlsTransport transport(tls);

        UploadServer server(transport, store, config.port, config.upload_handler_threads, config.shutdown_grace);
        server.start();

        // 4. Downloads
        PeerClient client(transport);
        DownloadOptions download_options;
        download_options.max_concurrent_fetches = config.max_concurrent_fetches;
        download_options.pause_poll_interval = config.pause_poll_interval;
        download_options.cleanup_partial_chunks = config.cleanup_partial_chunks;
        DownloadManager downloads(discovery, client, store, download_options);

        std::cout << "RiftShare node started on port " << server.port() << " (" << mode << " mode)" << std::endl;

        if (mode == "interactive") {
            CLI cli(store, discovery, client, downloads, server);
            cli.run();
        } else {
            asio::io_context signals_io;
            asio::signal_set signals(signals_io, SIGINT, SIGTERM);
            signals.async_wait([](const asio::error_code& ec, int signal_number) {
                if (!ec) LOG_INFO("Received signal ", signal_number, ", shutting down");
            });
            signals_io.run();
        }

        downloads.shutdown();
        server.stop();
        LOG_INFO("RiftShare node stopped");
    } catch (const std::exception& e) {
        LOG_ERR("Fatal error: ", e.what());
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
