#pragma once

#include "RequestService.h"

namespace ChatStorage {

/// Directory tree requests. Every one is answered with DirResponse.
class DirectoryService : public RequestService {
public:
    explicit DirectoryService(Correlator& correlator);

    /// Whole tree of the current user; slower server-side, so it gets a longer timeout
    Result<Json::Value> listTree();
    Result<Json::Value> createDirectory(int64_t parentId, const std::string& name);
    Result<Json::Value> renameDirectory(int64_t id, const std::string& name);
    Result<Json::Value> moveDirectory(int64_t id, int64_t newParentId);
    Result<Json::Value> deleteDirectory(int64_t id);

    void setListTimeout(std::chrono::milliseconds timeout) { listTimeout_ = timeout; }

private:
    std::chrono::milliseconds listTimeout_{config::DIRECTORY_LIST_TIMEOUT_MS};
};

} // namespace ChatStorage
