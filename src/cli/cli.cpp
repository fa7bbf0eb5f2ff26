#include "cli/cli.hpp"
#include "crypto/hasher.hpp"
#include "common/logger.hpp"
#include <sstream>
#include <iomanip>
#include <filesystem>

namespace fs = std::filesystem;

CLI::CLI(ContentStore& store, StaticPeerDiscovery& discovery, PeerClient& client,
         DownloadManager& downloads, UploadServer& server, std::ostream& out)
    : store_(store), discovery_(discovery), client_(client), downloads_(downloads),
      server_(server), out_(out), running_(false) {}

void CLI::run(std::istream& in) {
    running_ = true;
    print_help();

    std::string line;
    while (running_ && std::getline(in, line)) {
        if (line.empty()) continue;
        handle_command(line);
    }
    running_ = false;
}

void CLI::print_help() {
    out_ << "Available commands:\n"
         << "  share <file_path>             - Share a file\n"
         << "  list                          - List shared files\n"
         << "  remove <file_name>            - Stop sharing a file\n"
         << "  rescan                        - Rebuild the share index from the shared directory\n"
         << "  peer <host:port> [infohash]   - Add a seed peer, or a holder of one infohash\n"
         << "  peers                         - List seed peers\n"
         << "  fetch <infohash>              - Fetch and show the manifest of an infohash\n"
         << "  download <infohash>           - Download the content of an infohash\n"
         << "  pause <infohash>              - Pause a download\n"
         << "  resume <infohash>             - Resume a paused download\n"
         << "  cancel <infohash>             - Cancel a download\n"
         << "  status                        - Show downloads and the upload server\n"
         << "  help                          - Show this help\n"
         << "  quit / exit                   - Exit\n"
         << std::endl;
}

void CLI::handle_command(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;

    std::vector<std::string> args;
    std::string arg;
    while (iss >> arg) args.push_back(arg);

    if (cmd == "share") cmd_share(args);
    else if (cmd == "list") cmd_list(args);
    else if (cmd == "remove") cmd_remove(args);
    else if (cmd == "rescan") cmd_rescan(args);
    else if (cmd == "peer") cmd_peer(args);
    else if (cmd == "peers") cmd_peers(args);
    else if (cmd == "fetch") cmd_fetch(args);
    else if (cmd == "download") cmd_download(args);
    else if (cmd == "pause") cmd_pause(args);
    else if (cmd == "resume") cmd_resume(args);
    else if (cmd == "cancel") cmd_cancel(args);
    else if (cmd == "status") cmd_status(args);
    else if (cmd == "help") print_help();
    else if (cmd == "quit" || cmd == "exit") running_ = false;
    else out_ << "Unknown command: " << cmd << std::endl;
}

void CLI::cmd_share(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: share <file_path>" << std::endl;
        return;
    }
    const fs::path path = args[0];
    if (!fs::is_regular_file(path)) {
        out_ << "File not found: " << path.string() << std::endl;
        return;
    }

    try {
        Manifest m = store_.share_file(path);
        std::string infohash = Hasher::info_hash(m);
        out_ << "File shared successfully!\n"
             << "InfoHash: " << infohash << "\n"
             << "Size: " << m.total_size << " bytes\n"
             << "Chunks: " << m.chunk_count() << std::endl;

        if (!discovery_.announce(infohash)) {
            out_ << "Announcement failed; peers must be told about this node manually." << std::endl;
        }
    } catch (const std::exception& e) {
        out_ << "Error sharing file: " << e.what() << std::endl;
    }
}

void CLI::cmd_list(const std::vector<std::string>&) {
    auto shares = store_.list_shared_manifests();
    out_ << "Shared Files: " << shares.size() << std::endl;
    for (const auto& s : shares) {
        out_ << " - " << s.manifest.file_name << " (" << s.infohash << ", "
             << s.manifest.total_size << " bytes)" << std::endl;
    }
}

void CLI::cmd_remove(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: remove <file_name>" << std::endl;
        return;
    }
    try {
        if (store_.remove_shared(args[0])) {
            out_ << "Stopped sharing " << args[0] << std::endl;
        } else {
            out_ << "Not shared: " << args[0] << std::endl;
        }
    } catch (const std::exception& e) {
        out_ << "Error removing share: " << e.what() << std::endl;
    }
}

void CLI::cmd_rescan(const std::vector<std::string>&) {
    try {
        size_t count = store_.rescan();
        out_ << "Indexed " << count << " shared file(s)" << std::endl;
    } catch (const std::exception& e) {
        out_ << "Error rescanning: " << e.what() << std::endl;
    }
}

void CLI::cmd_peer(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: peer <host:port> [infohash]" << std::endl;
        return;
    }
    auto endpoint = PeerEndpoint::parse(args[0]);
    if (!endpoint) {
        out_ << "Invalid peer address: " << args[0] << std::endl;
        return;
    }
    if (args.size() > 1) {
        if (!Hasher::is_hex_digest(args[1])) {
            out_ << "Invalid infohash: " << args[1] << std::endl;
            return;
        }
        discovery_.add_peer(args[1], *endpoint);
        out_ << "Added " << endpoint->to_string() << " as a holder of " << args[1] << std::endl;
    } else {
        discovery_.add_seed(*endpoint);
        out_ << "Added seed peer " << endpoint->to_string() << std::endl;
    }
}

void CLI::cmd_peers(const std::vector<std::string>&) {
    auto seeds = discovery_.get_seeds();
    out_ << "Seed Peers: " << seeds.size() << std::endl;
    for (const auto& p : seeds) {
        out_ << " - " << p.to_string() << std::endl;
    }
}

std::optional<Manifest> CLI::lookup_manifest(const std::string& infohash) {
    auto peers = discovery_.find_peers(infohash);
    if (peers.empty()) {
        out_ << "No peers known for " << infohash << std::endl;
        return std::nullopt;
    }
    auto manifest = client_.find_manifest(peers, infohash);
    if (!manifest) {
        out_ << "No peer has " << infohash << " (asked " << peers.size() << ")" << std::endl;
    }
    return manifest;
}

void CLI::cmd_fetch(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: fetch <infohash>" << std::endl;
        return;
    }
    if (!Hasher::is_hex_digest(args[0])) {
        out_ << "Invalid infohash: " << args[0] << std::endl;
        return;
    }
    try {
        auto manifest = lookup_manifest(args[0]);
        if (manifest) {
            manifest->print(out_);
        }
    } catch (const std::exception& e) {
        out_ << "Error fetching manifest: " << e.what() << std::endl;
    }
}

void CLI::cmd_download(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: download <infohash>" << std::endl;
        return;
    }
    const std::string& infohash = args[0];
    if (!Hasher::is_hex_digest(infohash)) {
        out_ << "Invalid infohash: " << infohash << std::endl;
        return;
    }

    try {
        auto manifest = lookup_manifest(infohash);
        if (!manifest) return;

        // Runs on download threads; only terminal states are printed so the prompt stays usable.
        auto sink = [](const DownloadProgress& p) {
            if (!is_terminal(p.state)) return;
            std::ostringstream line;
            line << "[" << p.file_name << "] " << download_state_name(p.state);
            if (!p.message.empty()) line << ": " << p.message;
            LOG_INFO(line.str());
            std::cout << line.str() << std::endl;
        };

        if (downloads_.start_download(*manifest, infohash, sink)) {
            out_ << "Download started for " << manifest->file_name << " ("
                 << manifest->chunk_count() << " chunks)" << std::endl;
        } else {
            out_ << "Could not start download for " << infohash << std::endl;
        }
    } catch (const std::exception& e) {
        out_ << "Error starting download: " << e.what() << std::endl;
    }
}

void CLI::cmd_pause(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: pause <infohash>" << std::endl;
        return;
    }
    out_ << (downloads_.pause_download(args[0]) ? "Paused " : "No running download ")
         << args[0] << std::endl;
}

void CLI::cmd_resume(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: resume <infohash>" << std::endl;
        return;
    }
    out_ << (downloads_.resume_download(args[0]) ? "Resumed " : "No paused download ")
         << args[0] << std::endl;
}

void CLI::cmd_cancel(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: cancel <infohash>" << std::endl;
        return;
    }
    out_ << (downloads_.cancel_download(args[0]) ? "Cancelled " : "No active download ")
         << args[0] << std::endl;
}

void CLI::cmd_status(const std::vector<std::string>&) {
    if (server_.is_running()) {
        out_ << "Upload server: listening on port " << server_.port() << std::endl;
    } else {
        out_ << "Upload server: stopped" << std::endl;
    }

    auto downloads = downloads_.active_downloads();
    out_ << "Active Downloads: " << downloads.size() << std::endl;
    for (const auto& p : downloads) {
        out_ << " - " << p.file_name << " [" << download_state_name(p.state) << "] "
             << p.completed_chunks << "/" << p.total_chunks << " chunks ("
             << std::fixed << std::setprecision(1) << p.fraction * 100.0 << "%)"
             << std::defaultfloat << std::endl;
    }
}
