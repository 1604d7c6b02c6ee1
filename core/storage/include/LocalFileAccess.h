#pragma once

#include "IFileAccess.h"

namespace ChatStorage {

/**
 * @brief IFileAccess on the local filesystem.
 *
 * References are absolute paths, optionally written as file:// URLs.
 */
class LocalFileAccess : public IFileAccess {
public:
    Result<std::unique_ptr<std::istream>> openForRead(const std::string& path, uint64_t offset) override;
    Result<std::unique_ptr<std::ostream>> openForWriteAt(const std::string& path, uint64_t offset) override;
    bool exists(const std::string& path) override;
    Result<uint64_t> size(const std::string& path) override;
    Result<std::string> resolveReference(const std::string& reference) override;
    std::string makeReference(const std::string& path) override;

private:
    static std::string stripScheme(const std::string& reference);
};

} // namespace ChatStorage
