#include "SQLiteTaskStore.h"
#include "Logger.h"

namespace ChatStorage {

namespace {

const char* kSelectColumns =
    "SELECT task_id, file_reference, file_name, file_size, target_dir_id, user_id, user_name, "
    "status, progress, transferred_bytes, fingerprint, error_message, created_at FROM transfer_tasks ";

std::string columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

// Finalizes the statement on every return path
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (db) {
            rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
        }
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }
    sqlite3_stmt* get() { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_ERROR;
};

} // namespace

Error SQLiteTaskStore::dbError(const std::string& action) const {
    sqlite3* db = handler_->getDB();
    std::string message = action + ": " + (db ? sqlite3_errmsg(db) : "database is not open");
    Logger::instance().log(LogLevel::ERROR, message, "SQLiteTaskStore");
    return Error{ErrorCode::StoreError, message, "SQLiteTaskStore"};
}

TransferTask SQLiteTaskStore::readRow(sqlite3_stmt* stmt) {
    TransferTask task;
    task.taskId = columnText(stmt, 0);
    task.fileReference = columnText(stmt, 1);
    task.localPath = task.fileReference;
    task.fileName = columnText(stmt, 2);
    task.totalSize = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
    task.targetDirId = sqlite3_column_int64(stmt, 4);
    task.userId = sqlite3_column_int64(stmt, 5);
    task.userName = columnText(stmt, 6);
    task.status = transferStatusFromInt(sqlite3_column_int(stmt, 7)).value_or(TransferStatus::Paused);
    task.progress = sqlite3_column_double(stmt, 8);
    task.transferredBytes = static_cast<uint64_t>(sqlite3_column_int64(stmt, 9));
    task.fingerprint = columnText(stmt, 10);
    task.errorMessage = columnText(stmt, 11);
    task.createdAt = sqlite3_column_int64(stmt, 12);

    if (!task.applyDownloadMarker(task.fingerprint)) {
        task.direction = TransferDirection::Upload;
    }
    return task;
}

VoidResult SQLiteTaskStore::save(const TransferTask& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = handler_->getDB();

    const char* sql =
        "INSERT OR REPLACE INTO transfer_tasks (task_id, file_reference, file_name, file_size, target_dir_id, "
        "user_id, user_name, status, progress, transferred_bytes, fingerprint, error_message, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    Statement stmt(db, sql);
    if (!stmt.ok()) {
        return dbError("prepare save");
    }

    const std::string marker = task.persistedMarker();
    sqlite3_bind_text(stmt.get(), 1, task.taskId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, task.fileReference.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 3, task.fileName.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(task.totalSize));
    sqlite3_bind_int64(stmt.get(), 5, task.targetDirId);
    sqlite3_bind_int64(stmt.get(), 6, task.userId);
    sqlite3_bind_text(stmt.get(), 7, task.userName.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 8, static_cast<int>(task.status));
    sqlite3_bind_double(stmt.get(), 9, task.progress);
    sqlite3_bind_int64(stmt.get(), 10, static_cast<sqlite3_int64>(task.transferredBytes));
    sqlite3_bind_text(stmt.get(), 11, marker.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 12, task.errorMessage.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 13, task.createdAt);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return dbError("save task " + task.taskId);
    }
    return Ok();
}

VoidResult SQLiteTaskStore::updateStatus(const std::string& taskId, TransferStatus status,
                                         const std::string& errorMessage) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(handler_->getDB(), "UPDATE transfer_tasks SET status = ?, error_message = ? WHERE task_id = ?;");
    if (!stmt.ok()) {
        return dbError("prepare updateStatus");
    }
    sqlite3_bind_int(stmt.get(), 1, static_cast<int>(status));
    sqlite3_bind_text(stmt.get(), 2, errorMessage.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 3, taskId.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return dbError("update status of " + taskId);
    }
    return Ok();
}

VoidResult SQLiteTaskStore::updateProgress(const std::string& taskId, uint64_t transferredBytes, double progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(handler_->getDB(),
                   "UPDATE transfer_tasks SET transferred_bytes = ?, progress = ? WHERE task_id = ?;");
    if (!stmt.ok()) {
        return dbError("prepare updateProgress");
    }
    sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(transferredBytes));
    sqlite3_bind_double(stmt.get(), 2, progress);
    sqlite3_bind_text(stmt.get(), 3, taskId.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return dbError("update progress of " + taskId);
    }
    return Ok();
}

Result<std::optional<TransferTask>> SQLiteTaskStore::fetch(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string sql = std::string(kSelectColumns) + "WHERE task_id = ?;";
    Statement stmt(handler_->getDB(), sql.c_str());
    if (!stmt.ok()) {
        return dbError("prepare fetch");
    }
    sqlite3_bind_text(stmt.get(), 1, taskId.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return std::optional<TransferTask>(readRow(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        return dbError("fetch " + taskId);
    }
    return std::optional<TransferTask>();
}

Result<std::vector<TransferTask>> SQLiteTaskStore::fetchPending() {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string sql = std::string(kSelectColumns) + "WHERE status != ? ORDER BY created_at ASC, rowid ASC;";
    Statement stmt(handler_->getDB(), sql.c_str());
    if (!stmt.ok()) {
        return dbError("prepare fetchPending");
    }
    sqlite3_bind_int(stmt.get(), 1, static_cast<int>(TransferStatus::Completed));

    std::vector<TransferTask> tasks;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        tasks.push_back(readRow(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        return dbError("fetch pending tasks");
    }
    return tasks;
}

VoidResult SQLiteTaskStore::remove(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(handler_->getDB(), "DELETE FROM transfer_tasks WHERE task_id = ?;");
    if (!stmt.ok()) {
        return dbError("prepare remove");
    }
    sqlite3_bind_text(stmt.get(), 1, taskId.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return dbError("remove " + taskId);
    }
    return Ok();
}

VoidResult SQLiteTaskStore::removeCompleted() {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(handler_->getDB(), "DELETE FROM transfer_tasks WHERE status = ?;");
    if (!stmt.ok()) {
        return dbError("prepare removeCompleted");
    }
    sqlite3_bind_int(stmt.get(), 1, static_cast<int>(TransferStatus::Completed));
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return dbError("remove completed tasks");
    }
    return Ok();
}

} // namespace ChatStorage
