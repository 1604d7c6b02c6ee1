#include "FileService.h"

namespace ChatStorage {

FileService::FileService(Correlator& correlator) : RequestService(correlator, "FileService") {}

Result<FilePage> FileService::listFiles(int64_t dirId, int pageNum, int pageSize, const std::string& nameFilter) {
    if (pageNum < 1 || pageSize < 1) {
        return Error{ErrorCode::InvalidArgument, "page numbers start at 1", component_};
    }
    Json::Value body;
    body["dirId"] = static_cast<Json::Int64>(dirId);
    body["pageNum"] = pageNum;
    body["pageSize"] = pageSize;
    if (!nameFilter.empty()) {
        body["fileName"] = nameFilter;
    }

    auto data = call(FrameType::FileListReq, body, FrameType::FileResponse);
    if (!data) {
        return data.error();
    }

    FilePage page;
    const Json::Value& value = data.value();
    if (value.isArray()) {
        page.records = value;
        page.totalPages = 1;
        page.totalCount = static_cast<int64_t>(value.size());
    } else if (value.isObject()) {
        if (value["recordList"].isArray()) {
            page.records = value["recordList"];
        }
        page.totalPages = jsonInt64(value["totalPage"]);
        page.totalCount = jsonInt64(value["totalCount"], static_cast<int64_t>(page.records.size()));
    }
    return page;
}

Result<Json::Value> FileService::fileDetail(int64_t fileId) {
    Json::Value body;
    body["fileId"] = static_cast<Json::Int64>(fileId);
    return call(FrameType::FileDetailReq, body, FrameType::FileResponse);
}

Result<Json::Value> FileService::deleteFile(int64_t fileId) {
    Json::Value body;
    body["fileId"] = static_cast<Json::Int64>(fileId);
    return call(FrameType::FileDeleteReq, body, FrameType::FileResponse);
}

} // namespace ChatStorage
