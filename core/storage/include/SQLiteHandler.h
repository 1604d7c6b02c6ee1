#pragma once

#include "Result.h"
#include <sqlite3.h>
#include <string>

namespace ChatStorage {

/**
 * @brief Handles SQLite database connection and schema management
 */
class SQLiteHandler {
public:
    SQLiteHandler() = default;
    ~SQLiteHandler();

    SQLiteHandler(const SQLiteHandler&) = delete;
    SQLiteHandler& operator=(const SQLiteHandler&) = delete;

    /**
     * @brief Open the database and bring the schema to the current version.
     *
     * An empty path resolves to $CHATSTORAGE_DB_PATH, then
     * $XDG_DATA_HOME/chatstorage/tasks.db, then ~/.local/share/chatstorage/tasks.db.
     * ":memory:" opens a private in-memory database.
     */
    VoidResult initialize(const std::string& dbPath = "");

    void shutdown();

    sqlite3* getDB() { return db_; }

    const std::string& path() const { return path_; }

    static std::string defaultPath();

private:
    sqlite3* db_ = nullptr;
    std::string path_;

    VoidResult createTables();
};

} // namespace ChatStorage
