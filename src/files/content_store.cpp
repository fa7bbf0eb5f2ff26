#include "files/content_store.hpp"
#include "files/chunker.hpp"
#include "crypto/hasher.hpp"
#include "common/serializer.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <fstream>
#include <sstream>
#include <map>

namespace fs = std::filesystem;

namespace {
    void write_file_atomically(const fs::path& target, const std::string& content) {
        fs::path tmp = target;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw IOError("Cannot write " + tmp.string());
            }
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            out.close();
            if (!out) {
                std::error_code ignored;
                fs::remove(tmp, ignored);
                throw IOError("Short write to " + tmp.string());
            }
        }
        std::error_code ec;
        fs::rename(tmp, target, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw IOError("Cannot move " + tmp.string() + " into place: " + ec.message());
        }
    }

    std::optional<std::string> read_file(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) return std::nullopt;
        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad()) return std::nullopt;
        return ss.str();
    }

    void create_dir(const fs::path& dir) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec || !fs::is_directory(dir)) {
            throw IOError("Cannot create directory " + dir.string() + (ec ? ": " + ec.message() : ""));
        }
    }
}

ContentStore::ContentStore(fs::path shared_dir, fs::path downloads_dir, StorageManager& index, uint32_t chunk_size)
    : shared_dir_(std::move(shared_dir)),
      downloads_dir_(std::move(downloads_dir)),
      index_(index),
      chunk_size_(chunk_size) {
    if (chunk_size_ == 0) {
        throw IOError("Chunk size must be positive");
    }
    create_dir(shared_dir_);
    create_dir(downloads_dir_);
}

Manifest ContentStore::share_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw IOError("File does not exist or is not a regular file: " + path.string());
    }

    fs::path target = shared_dir_ / path.filename();
    if (!fs::exists(target)) {
        fs::copy_file(path, target, ec);
        if (ec) {
            throw IOError("Cannot copy " + path.string() + " into " + shared_dir_.string() + ": " + ec.message());
        }
        LOG_INFO("Copied ", path.string(), " to ", target.string());
    } else if (!fs::equivalent(path, target, ec)) {
        LOG_WARN("A file named ", path.filename().string(), " is already shared; keeping the existing copy");
    }
    return create_manifest(target);
}

Manifest ContentStore::create_manifest(const fs::path& source_file) {
    Manifest manifest = Chunker::create_manifest_from_file(source_file, chunk_size_);
    std::string encoded;
    try {
        encoded = Serializer::serialize_manifest(manifest);
    } catch (const ProtocolError& e) {
        throw IOError(e.what());
    }
    std::string infohash = Hasher::content_hash(encoded);

    write_file_atomically(metadata_path(infohash), encoded);

    std::error_code ec;
    fs::path absolute = fs::absolute(source_file, ec);
    ShareRecord record;
    record.infohash = infohash;
    record.file_name = manifest.file_name;
    record.file_path = (ec ? source_file : absolute).lexically_normal().string();
    record.total_size = manifest.total_size;
    record.chunk_size = manifest.chunk_size;
    record.chunk_count = manifest.chunk_count();
    if (!index_.save_share(record)) {
        throw IOError("Cannot record share for " + manifest.file_name);
    }

    LOG_INFO("Sharing ", manifest.file_name, " (", manifest.total_size, " bytes, ",
             manifest.chunk_count(), " chunks) as ", infohash);
    return manifest;
}

fs::path ContentStore::source_path_for(const std::string& infohash, const Manifest& manifest) {
    if (auto record = index_.get_share(infohash)) {
        return record->file_path;
    }
    return shared_dir_ / fs::path(manifest.file_name).filename();
}

std::vector<uint8_t> ContentStore::read_chunk(const Manifest& manifest, uint32_t index) {
    if (index >= manifest.chunk_count()) {
        throw IOError("Chunk index " + std::to_string(index) + " out of range for " + manifest.file_name);
    }
    fs::path source = source_path_for(Hasher::info_hash(manifest), manifest);
    return Chunker::read_span(source, manifest.chunk_offset(index), manifest.chunk_length(index));
}

fs::path ContentStore::reassemble(const Manifest& manifest, const std::string& infohash) {
    fs::path name = fs::path(manifest.file_name).filename();
    if (name.empty() || name == "." || name == "..") {
        throw IOError("Invalid output file name '" + manifest.file_name + "'");
    }

    fs::path destination = downloads_dir_ / name;
    std::error_code exists_ec;
    if (fs::exists(destination, exists_ec)) {
        // Another file already has this name; tag ours with the infohash instead of replacing it.
        fs::path tagged = name.stem();
        tagged += "." + infohash.substr(0, 8);
        tagged += name.extension();
        LOG_WARN(destination.string(), " already exists; saving ", manifest.file_name, " as ", tagged.string());
        destination = downloads_dir_ / tagged;
    }
    fs::path tmp = destination;
    tmp += ".part-" + infohash.substr(0, 16);

    auto discard = [&tmp]() {
        std::error_code ignored;
        fs::remove(tmp, ignored);
    };

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw IOError("Cannot create " + tmp.string());
        }

        for (uint32_t i = 0; i < manifest.chunk_count(); ++i) {
            fs::path blob = chunk_path(infohash, i);
            std::ifstream in(blob, std::ios::binary);
            if (!in) {
                out.close();
                discard();
                throw IOError("Missing chunk " + std::to_string(i) + " of " + manifest.file_name);
            }
            out << in.rdbuf();
            if (!out) {
                out.close();
                discard();
                throw IOError("Failed writing chunk " + std::to_string(i) + " to " + tmp.string());
            }
        }

        out.close();
        if (!out) {
            discard();
            throw IOError("Failed to finish " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, destination, ec);
    if (ec) {
        discard();
        throw IOError("Cannot move " + tmp.string() + " to " + destination.string() + ": " + ec.message());
    }
    LOG_INFO("Reassembled ", manifest.file_name, " into ", destination.string());
    return destination;
}

std::optional<std::string> ContentStore::load_manifest_bytes(const std::string& infohash) {
    if (!Hasher::is_hex_digest(infohash)) return std::nullopt;
    return read_file(metadata_path(infohash));
}

std::optional<Manifest> ContentStore::find_manifest(const std::string& infohash) {
    auto bytes = load_manifest_bytes(infohash);
    if (!bytes) return std::nullopt;
    try {
        return Serializer::deserialize_manifest(*bytes);
    } catch (const ProtocolError& e) {
        LOG_WARN("Ignoring unreadable manifest ", infohash, ": ", e.what());
        return std::nullopt;
    }
}

std::vector<SharedManifest> ContentStore::list_shared_manifests() {
    std::vector<SharedManifest> result;
    for (const auto& record : index_.get_all_shares()) {
        auto manifest = find_manifest(record.infohash);
        if (!manifest) {
            LOG_WARN("Share row ", record.infohash, " has no manifest file");
            continue;
        }
        result.push_back({record.infohash, *manifest, record.file_path});
    }
    return result;
}

std::optional<SharedManifest> ContentStore::find_manifest_by_name(const std::string& file_name) {
    auto record = index_.find_share_by_name(file_name);
    if (!record) return std::nullopt;
    auto manifest = find_manifest(record->infohash);
    if (!manifest) return std::nullopt;
    return SharedManifest{record->infohash, *manifest, record->file_path};
}

bool ContentStore::is_inside_shared_dir(const fs::path& path) const {
    std::error_code ec;
    fs::path parent = fs::weakly_canonical(path, ec).parent_path();
    if (ec) return false;
    fs::path shared = fs::weakly_canonical(shared_dir_, ec);
    if (ec) return false;
    return parent == shared;
}

bool ContentStore::remove_shared(const std::string& file_name) {
    auto record = index_.find_share_by_name(file_name);
    if (!record) {
        return false;
    }

    std::error_code ec;
    fs::remove(metadata_path(record->infohash), ec);
    if (ec) {
        LOG_WARN("Could not remove manifest for ", file_name, ": ", ec.message());
    }
    index_.delete_share(record->infohash);

    fs::path source = record->file_path;
    if (is_inside_shared_dir(source)) {
        fs::remove(source, ec);
        if (ec) {
            LOG_WARN("Could not remove ", source.string(), ": ", ec.message());
        }
    }
    LOG_INFO("Stopped sharing ", file_name, " (", record->infohash, ")");
    return true;
}

size_t ContentStore::rescan() {
    std::map<std::string, std::string> known_paths;
    for (const auto& record : index_.get_all_shares()) {
        known_paths[record.infohash] = record.file_path;
    }
    if (!index_.clear_shares()) {
        throw IOError("Cannot reset the share index");
    }

    size_t restored = 0;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(shared_dir_, ec)) {
        const fs::path& path = entry.path();
        if (!entry.is_regular_file() || path.extension() != METADATA_EXTENSION) continue;

        std::string infohash = path.stem().string();
        auto bytes = read_file(path);
        if (!bytes) continue;

        Manifest manifest;
        try {
            manifest = Serializer::deserialize_manifest(*bytes);
        } catch (const ProtocolError& e) {
            LOG_WARN("Skipping ", path.filename().string(), ": ", e.what());
            continue;
        }
        if (Hasher::content_hash(*bytes) != infohash) {
            LOG_WARN("Skipping ", path.filename().string(), ": name does not match its content");
            continue;
        }

        ShareRecord record;
        record.infohash = infohash;
        record.file_name = manifest.file_name;
        auto it = known_paths.find(infohash);
        record.file_path = it != known_paths.end()
            ? it->second
            : fs::absolute(shared_dir_ / fs::path(manifest.file_name).filename()).lexically_normal().string();
        record.total_size = manifest.total_size;
        record.chunk_size = manifest.chunk_size;
        record.chunk_count = manifest.chunk_count();
        if (index_.save_share(record)) {
            ++restored;
        }
    }
    if (ec) {
        throw IOError("Cannot list " + shared_dir_.string() + ": " + ec.message());
    }

    LOG_INFO("Rescan restored ", restored, " shared file(s)");
    return restored;
}

fs::path ContentStore::metadata_path(const std::string& infohash) const {
    return shared_dir_ / (infohash + METADATA_EXTENSION);
}

fs::path ContentStore::chunk_dir(const std::string& infohash) const {
    return downloads_dir_ / infohash;
}

fs::path ContentStore::chunk_path(const std::string& infohash, uint32_t index) const {
    return chunk_dir(infohash) / (CHUNK_FILE_PREFIX + std::to_string(index));
}

void ContentStore::prepare_chunk_dir(const std::string& infohash) {
    if (!Hasher::is_hex_digest(infohash)) {
        throw IOError("Refusing chunk directory for malformed infohash");
    }
    create_dir(chunk_dir(infohash));
}

void ContentStore::write_chunk(const std::string& infohash, uint32_t index, const std::vector<uint8_t>& data) {
    fs::path blob = chunk_path(infohash, index);
    std::ofstream out(blob, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IOError("Cannot create " + blob.string());
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        throw IOError("Short write to " + blob.string());
    }
}

void ContentStore::remove_chunk_dir(const std::string& infohash) {
    if (!Hasher::is_hex_digest(infohash)) return;
    std::error_code ec;
    fs::remove_all(chunk_dir(infohash), ec);
    if (ec) {
        throw IOError("Cannot remove " + chunk_dir(infohash).string() + ": " + ec.message());
    }
}
