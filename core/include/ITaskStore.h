#pragma once

#include "Result.h"
#include "TransferTask.h"

#include <optional>
#include <string>
#include <vector>

namespace ChatStorage {

/**
 * @brief Persistent record store for transfer tasks, keyed by task id.
 */
class ITaskStore {
public:
    virtual ~ITaskStore() = default;

    /// Insert or replace the whole record
    virtual VoidResult save(const TransferTask& task) = 0;

    virtual VoidResult updateStatus(const std::string& taskId, TransferStatus status,
                                    const std::string& errorMessage = "") = 0;

    virtual VoidResult updateProgress(const std::string& taskId, uint64_t transferredBytes, double progress) = 0;

    virtual Result<std::optional<TransferTask>> fetch(const std::string& taskId) = 0;

    /// Every task not Completed, oldest first
    virtual Result<std::vector<TransferTask>> fetchPending() = 0;

    virtual VoidResult remove(const std::string& taskId) = 0;

    virtual VoidResult removeCompleted() = 0;
};

} // namespace ChatStorage
