#pragma once

#include "ITaskStore.h"
#include "SQLiteHandler.h"

#include <mutex>

namespace ChatStorage {

/**
 * @brief ITaskStore on the transfer_tasks table.
 *
 * Calls are serialised on one mutex; the handler must outlive the store.
 */
class SQLiteTaskStore : public ITaskStore {
public:
    explicit SQLiteTaskStore(SQLiteHandler* handler) : handler_(handler) {}

    VoidResult save(const TransferTask& task) override;
    VoidResult updateStatus(const std::string& taskId, TransferStatus status,
                            const std::string& errorMessage = "") override;
    VoidResult updateProgress(const std::string& taskId, uint64_t transferredBytes, double progress) override;
    Result<std::optional<TransferTask>> fetch(const std::string& taskId) override;
    Result<std::vector<TransferTask>> fetchPending() override;
    VoidResult remove(const std::string& taskId) override;
    VoidResult removeCompleted() override;

private:
    Error dbError(const std::string& action) const;
    static TransferTask readRow(sqlite3_stmt* stmt);

    SQLiteHandler* handler_;
    std::mutex mutex_;
};

} // namespace ChatStorage
