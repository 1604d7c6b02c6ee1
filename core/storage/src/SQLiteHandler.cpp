#include "SQLiteHandler.h"
#include "Constants.h"
#include "Logger.h"
#include <cstdlib>
#include <filesystem>

namespace ChatStorage {

SQLiteHandler::~SQLiteHandler() {
    shutdown();
}

std::string SQLiteHandler::defaultPath() {
    if (const char* envPath = std::getenv("CHATSTORAGE_DB_PATH")) {
        return envPath;
    }
    std::filesystem::path dataDir;
    if (const char* xdgData = std::getenv("XDG_DATA_HOME")) {
        dataDir = std::filesystem::path(xdgData) / "chatstorage";
    } else if (const char* home = std::getenv("HOME")) {
        dataDir = std::filesystem::path(home) / ".local" / "share" / "chatstorage";
    } else {
        dataDir = "/tmp/chatstorage";
    }
    return (dataDir / "tasks.db").string();
}

VoidResult SQLiteHandler::initialize(const std::string& dbPath) {
    auto& logger = Logger::instance();

    path_ = dbPath.empty() ? defaultPath() : dbPath;

    if (path_ != ":memory:") {
        auto dirPath = std::filesystem::path(path_).parent_path();
        if (!dirPath.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(dirPath, ec);
            if (ec) {
                logger.log(LogLevel::ERROR, "Failed to create database directory: " + dirPath.string() + " (" + ec.message() + ")", "SQLiteHandler");
            }
        }
    }

    logger.log(LogLevel::INFO, "Initializing SQLite database: " + path_, "SQLiteHandler");

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        logger.log(LogLevel::ERROR, "Cannot open database: " + message, "SQLiteHandler");
        shutdown();
        return Error{ErrorCode::StoreError, "cannot open " + path_ + ": " + message, "SQLiteHandler"};
    }

    char* errMsg = nullptr;
    if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &errMsg) != SQLITE_OK) {
        logger.log(LogLevel::WARN, "Failed to enable WAL mode: " + std::string(errMsg ? errMsg : "unknown"), "SQLiteHandler");
        sqlite3_free(errMsg);
    }

    // Scheduler executions persist progress from several threads
    sqlite3_busy_timeout(db_, config::DB_BUSY_TIMEOUT_MS);

    // Simple schema versioning using PRAGMA user_version
    int userVersion = 0;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            userVersion = sqlite3_column_int(stmt, 0);
        }
    }
    if (stmt) {
        sqlite3_finalize(stmt);
    }

    const int targetVersion = 1;

    auto created = createTables();
    if (!created) {
        return created;
    }

    if (userVersion < targetVersion) {
        if (sqlite3_exec(db_, "PRAGMA user_version = 1;", nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string message = errMsg ? errMsg : "unknown";
            sqlite3_free(errMsg);
            logger.log(LogLevel::ERROR, "Failed to set user_version: " + message, "SQLiteHandler");
            return Error{ErrorCode::StoreError, "schema version: " + message, "SQLiteHandler"};
        }
    }

    return Ok();
}

void SQLiteHandler::shutdown() {
    if (db_) {
        Logger::instance().log(LogLevel::DEBUG, "Closing SQLite database", "SQLiteHandler");
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

VoidResult SQLiteHandler::createTables() {
    const char* sql =
        "CREATE TABLE IF NOT EXISTS transfer_tasks ("
        "task_id TEXT PRIMARY KEY,"
        "file_reference TEXT NOT NULL,"
        "file_name TEXT,"
        "file_size INTEGER DEFAULT 0,"
        "target_dir_id INTEGER DEFAULT 0,"
        "user_id INTEGER DEFAULT 0,"
        "user_name TEXT,"
        "status INTEGER NOT NULL,"
        "progress REAL DEFAULT 0,"
        "transferred_bytes INTEGER DEFAULT 0,"
        "fingerprint TEXT,"
        "error_message TEXT,"
        "created_at INTEGER);"

        "CREATE INDEX IF NOT EXISTS idx_transfer_tasks_status ON transfer_tasks(status);";

    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string message = errMsg ? errMsg : "unknown";
        sqlite3_free(errMsg);
        Logger::instance().log(LogLevel::ERROR, "Failed to create tables: " + message, "SQLiteHandler");
        return Error{ErrorCode::StoreError, "create tables: " + message, "SQLiteHandler"};
    }
    return Ok();
}

} // namespace ChatStorage
