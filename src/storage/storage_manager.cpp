#include "storage/storage_manager.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <sqlite3.h>
#include <ctime>   // For std::time

namespace {
    std::string column_string(sqlite3_stmt* stmt, int column) {
        const unsigned char* text = sqlite3_column_text(stmt, column);
        return text ? reinterpret_cast<const char*>(text) : std::string();
    }

    ShareRecord read_row(sqlite3_stmt* stmt) {
        ShareRecord record;
        record.infohash = column_string(stmt, 0);
        record.file_name = column_string(stmt, 1);
        record.file_path = column_string(stmt, 2);
        record.total_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
        record.chunk_size = static_cast<uint32_t>(sqlite3_column_int64(stmt, 4));
        record.chunk_count = static_cast<uint32_t>(sqlite3_column_int64(stmt, 5));
        record.shared_at = sqlite3_column_int64(stmt, 6);
        return record;
    }

    const char* SELECT_COLUMNS =
        "SELECT infohash, file_name, file_path, total_size, chunk_size, chunk_count, shared_at FROM shares";
}

StorageManager::StorageManager(const std::string& db_path)
    : db_path_(db_path), db_(nullptr) {
    // Open the database immediately
    if (!open()) {
        close();
        throw IOError("Failed to open database: " + db_path);
    }
    if (!create_tables()) {
        close();
        throw IOError("Failed to create tables in database: " + db_path);
    }
}

StorageManager::~StorageManager() {
    close();
}

bool StorageManager::open() {
    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        LOG_ERR("Can't open database: ", db_ ? sqlite3_errmsg(db_) : "out of memory");
        return false;
    }
    sqlite3_busy_timeout(db_, 2000);
    LOG_DEBUG("Opened database successfully: ", db_path_);
    return true;
}

void StorageManager::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_DEBUG("Closed database ", db_path_);
    }
}

bool StorageManager::execute_sql(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LOG_ERR("SQL error: ", err_msg ? err_msg : sqlite3_errmsg(db_));
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool StorageManager::create_tables() {
    std::string create_shares_sql = R"(
        CREATE TABLE IF NOT EXISTS shares (
            infohash TEXT PRIMARY KEY NOT NULL,
            file_name TEXT NOT NULL,
            file_path TEXT NOT NULL,
            total_size INTEGER NOT NULL,
            chunk_size INTEGER NOT NULL,
            chunk_count INTEGER NOT NULL,
            shared_at INTEGER NOT NULL
        );
    )";

    std::string create_name_index_sql =
        "CREATE INDEX IF NOT EXISTS shares_file_name ON shares (file_name);";

    return execute_sql(create_shares_sql) && execute_sql(create_name_index_sql);
}

bool StorageManager::save_share(const ShareRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    std::string sql = "INSERT OR REPLACE INTO shares (infohash, file_name, file_path, total_size, chunk_size, chunk_count, shared_at) VALUES (?, ?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        return false;
    }

    int64_t shared_at = record.shared_at != 0 ? record.shared_at : static_cast<int64_t>(std::time(nullptr));
    sqlite3_bind_text(stmt, 1, record.infohash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, record.file_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, record.file_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(record.total_size));
    sqlite3_bind_int64(stmt, 5, record.chunk_size);
    sqlite3_bind_int64(stmt, 6, record.chunk_count);
    sqlite3_bind_int64(stmt, 7, shared_at);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to execute statement: ", sqlite3_errmsg(db_));
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}

std::vector<ShareRecord> StorageManager::query_shares(const std::string& sql, const std::string* param) {
    std::vector<ShareRecord> records;
    if (!db_) return records;

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        return records;
    }
    if (param) {
        sqlite3_bind_text(stmt, 1, param->c_str(), -1, SQLITE_TRANSIENT);
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        records.push_back(read_row(stmt));
    }

    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to execute statement: ", sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return records;
}

std::optional<ShareRecord> StorageManager::get_share(const std::string& infohash) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = query_shares(std::string(SELECT_COLUMNS) + " WHERE infohash = ?;", &infohash);
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::optional<ShareRecord> StorageManager::find_share_by_name(const std::string& file_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Most recently shared wins when several files carry the same name.
    auto rows = query_shares(std::string(SELECT_COLUMNS) + " WHERE file_name = ? ORDER BY shared_at DESC, infohash LIMIT 1;", &file_name);
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::vector<ShareRecord> StorageManager::get_all_shares() {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_shares(std::string(SELECT_COLUMNS) + " ORDER BY file_name, infohash;", nullptr);
}

bool StorageManager::delete_share(const std::string& infohash) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    std::string sql = "DELETE FROM shares WHERE infohash = ?;";
    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        return false;
    }

    sqlite3_bind_text(stmt, 1, infohash.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to execute statement: ", sqlite3_errmsg(db_));
        sqlite3_finalize(stmt);
        return false;
    }
    bool removed = sqlite3_changes(db_) > 0;
    sqlite3_finalize(stmt);
    return removed;
}

bool StorageManager::clear_shares() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;
    return execute_sql("DELETE FROM shares;");
}
