#ifndef RIFT_CLI_HPP
#define RIFT_CLI_HPP

#include <string>
#include <vector>
#include <iostream>

#include "../files/content_store.hpp"
#include "../files/download_manager.hpp"
#include "../discovery/static_peer_discovery.hpp"
#include "../network/peer_client.hpp"
#include "../network/upload_server.hpp"

class CLI {
public:
    CLI(ContentStore& store, StaticPeerDiscovery& discovery, PeerClient& client,
        DownloadManager& downloads, UploadServer& server,
        std::ostream& out = std::cout);

    // Reads commands from `in` until quit or end of input.
    void run(std::istream& in = std::cin);

    void handle_command(const std::string& line);
    bool is_running() const { return running_; }

private:
    void print_help();

    void cmd_share(const std::vector<std::string>& args);
    void cmd_list(const std::vector<std::string>& args);
    void cmd_remove(const std::vector<std::string>& args);
    void cmd_rescan(const std::vector<std::string>& args);
    void cmd_peer(const std::vector<std::string>& args);
    void cmd_peers(const std::vector<std::string>& args);
    void cmd_fetch(const std::vector<std::string>& args);
    void cmd_download(const std::vector<std::string>& args);
    void cmd_pause(const std::vector<std::string>& args);
    void cmd_resume(const std::vector<std::string>& args);
    void cmd_cancel(const std::vector<std::string>& args);
    void cmd_status(const std::vector<std::string>& args);

    std::optional<Manifest> lookup_manifest(const std::string& infohash);

    ContentStore& store_;
    StaticPeerDiscovery& discovery_;
    PeerClient& client_;
    DownloadManager& downloads_;
    UploadServer& server_;
    std::ostream& out_;
    bool running_;
};

#endif // RIFT_CLI_HPP
