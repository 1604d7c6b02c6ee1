#pragma once

#include "Result.h"

#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <string>

namespace ChatStorage {

/**
 * @brief Local file access used by the transfer engine.
 */
class IFileAccess {
public:
    virtual ~IFileAccess() = default;

    /// Opened and positioned at offset
    virtual Result<std::unique_ptr<std::istream>> openForRead(const std::string& path, uint64_t offset) = 0;

    /// Offset 0 truncates; any other offset keeps the first offset bytes and writes after them
    virtual Result<std::unique_ptr<std::ostream>> openForWriteAt(const std::string& path, uint64_t offset) = 0;

    virtual bool exists(const std::string& path) = 0;

    virtual Result<uint64_t> size(const std::string& path) = 0;

    /**
     * @brief Turn a persisted reference back into an openable path.
     *
     * Fails with FileNotFound when the file (for uploads) or its directory
     * (for downloads) is gone or no longer accessible.
     */
    virtual Result<std::string> resolveReference(const std::string& reference) = 0;

    /// Reference to persist for a path
    virtual std::string makeReference(const std::string& path) = 0;
};

} // namespace ChatStorage
