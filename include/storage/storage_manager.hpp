#ifndef RIFT_STORAGE_MANAGER_HPP
#define RIFT_STORAGE_MANAGER_HPP

#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <cstdint>

// Forward declarations for SQLite types
struct sqlite3;
struct sqlite3_stmt;

// One row of the local share index.
struct ShareRecord {
    std::string infohash;
    std::string file_name;
    std::string file_path; // absolute path of the shared original
    uint64_t total_size = 0;
    uint32_t chunk_size = 0;
    uint32_t chunk_count = 0;
    int64_t shared_at = 0; // unix seconds
};

class StorageManager {
public:
    /**
     * @brief Opens (creating if needed) the index database and its tables.
     * @throws IOError if the database cannot be opened or initialised.
     */
    explicit StorageManager(const std::string& db_path);
    ~StorageManager();

    StorageManager(const StorageManager&) = delete;
    StorageManager& operator=(const StorageManager&) = delete;

    void close();

    // Share operations
    bool save_share(const ShareRecord& record);
    std::optional<ShareRecord> get_share(const std::string& infohash);
    std::optional<ShareRecord> find_share_by_name(const std::string& file_name);
    std::vector<ShareRecord> get_all_shares();
    bool delete_share(const std::string& infohash);
    bool clear_shares();

    const std::string& path() const { return db_path_; }

private:
    std::string db_path_;
    sqlite3* db_;
    std::mutex mutex_;

    bool open();
    bool create_tables();

    // Helper for executing SQL statements
    bool execute_sql(const std::string& sql);
    std::vector<ShareRecord> query_shares(const std::string& sql, const std::string* param);
};

#endif // RIFT_STORAGE_MANAGER_HPP
