#pragma once

#include "RequestService.h"

namespace ChatStorage {

struct FilePage {
    Json::Value records{Json::arrayValue};
    int64_t totalPages{0};
    int64_t totalCount{0};
};

/// File listing and management requests. Every one is answered with FileResponse.
class FileService : public RequestService {
public:
    explicit FileService(Correlator& correlator);

    /// pageNum starts at 1; an empty nameFilter lists everything
    Result<FilePage> listFiles(int64_t dirId, int pageNum, int pageSize, const std::string& nameFilter = "");
    Result<Json::Value> fileDetail(int64_t fileId);
    Result<Json::Value> deleteFile(int64_t fileId);
};

} // namespace ChatStorage
