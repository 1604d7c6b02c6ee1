#include "DirectoryService.h"

namespace ChatStorage {

DirectoryService::DirectoryService(Correlator& correlator) : RequestService(correlator, "DirectoryService") {}

Result<Json::Value> DirectoryService::listTree() {
    return call(FrameType::DirListReq, Json::Value(), FrameType::DirResponse, listTimeout_);
}

Result<Json::Value> DirectoryService::createDirectory(int64_t parentId, const std::string& name) {
    if (name.empty()) {
        return Error{ErrorCode::InvalidArgument, "directory name is empty", component_};
    }
    Json::Value body;
    body["pId"] = static_cast<Json::Int64>(parentId);
    body["dirName"] = name;
    return call(FrameType::DirCreateReq, body, FrameType::DirResponse);
}

Result<Json::Value> DirectoryService::renameDirectory(int64_t id, const std::string& name) {
    if (name.empty()) {
        return Error{ErrorCode::InvalidArgument, "directory name is empty", component_};
    }
    Json::Value body;
    body["id"] = static_cast<Json::Int64>(id);
    body["dirName"] = name;
    return call(FrameType::DirUpdateReq, body, FrameType::DirResponse);
}

Result<Json::Value> DirectoryService::moveDirectory(int64_t id, int64_t newParentId) {
    if (id == newParentId) {
        return Error{ErrorCode::InvalidArgument, "cannot move a directory into itself", component_};
    }
    Json::Value body;
    body["id"] = static_cast<Json::Int64>(id);
    body["pId"] = static_cast<Json::Int64>(newParentId);
    return call(FrameType::DirMoveReq, body, FrameType::DirResponse);
}

Result<Json::Value> DirectoryService::deleteDirectory(int64_t id) {
    Json::Value body;
    body["id"] = static_cast<Json::Int64>(id);
    return call(FrameType::DirDeleteReq, body, FrameType::DirResponse);
}

} // namespace ChatStorage
