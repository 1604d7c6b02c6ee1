#include "LocalFileAccess.h"
#include "Logger.h"

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace ChatStorage {

namespace {
const char* kFileScheme = "file://";
}

std::string LocalFileAccess::stripScheme(const std::string& reference) {
    const std::string scheme = kFileScheme;
    if (reference.compare(0, scheme.size(), scheme) == 0) {
        return reference.substr(scheme.size());
    }
    return reference;
}

Result<std::unique_ptr<std::istream>> LocalFileAccess::openForRead(const std::string& path, uint64_t offset) {
    auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!file->is_open()) {
        Logger::instance().log(LogLevel::ERROR, "Failed to open file for reading: " + path, "LocalFileAccess");
        return Error{ErrorCode::FileNotFound, "cannot open " + path, "LocalFileAccess"};
    }
    if (offset > 0) {
        file->seekg(static_cast<std::streamoff>(offset), std::ios::beg);
        if (!file->good()) {
            return Error{ErrorCode::FileIOError, "cannot seek " + path + " to " + std::to_string(offset),
                         "LocalFileAccess"};
        }
    }
    return std::unique_ptr<std::istream>(std::move(file));
}

Result<std::unique_ptr<std::ostream>> LocalFileAccess::openForWriteAt(const std::string& path, uint64_t offset) {
    fs::path filePath(path);
    if (filePath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(filePath.parent_path(), ec);
        if (ec) {
            Logger::instance().log(LogLevel::ERROR, "Failed to create directory for " + path + ": " + ec.message(),
                                   "LocalFileAccess");
            return Error{ErrorCode::FileIOError, ec.message(), "LocalFileAccess"};
        }
    }

    if (offset == 0) {
        auto file = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
        if (!file->is_open()) {
            return Error{ErrorCode::FileIOError, "cannot create " + path, "LocalFileAccess"};
        }
        return std::unique_ptr<std::ostream>(std::move(file));
    }

    // Drop anything past the resume point before appending
    std::error_code ec;
    if (!fs::exists(filePath, ec)) {
        return Error{ErrorCode::FileNotFound, "partial file missing: " + path, "LocalFileAccess"};
    }
    if (fs::file_size(filePath, ec) > offset) {
        fs::resize_file(filePath, offset, ec);
    }
    if (ec) {
        return Error{ErrorCode::FileIOError, "cannot prepare " + path + ": " + ec.message(), "LocalFileAccess"};
    }

    auto file = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::in | std::ios::out);
    if (!file->is_open()) {
        return Error{ErrorCode::FileIOError, "cannot open " + path + " for writing", "LocalFileAccess"};
    }
    file->seekp(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!file->good()) {
        return Error{ErrorCode::FileIOError, "cannot seek " + path, "LocalFileAccess"};
    }
    return std::unique_ptr<std::ostream>(std::move(file));
}

bool LocalFileAccess::exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

Result<uint64_t> LocalFileAccess::size(const std::string& path) {
    std::error_code ec;
    auto bytes = fs::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::FileNotFound, path + ": " + ec.message(), "LocalFileAccess"};
    }
    return static_cast<uint64_t>(bytes);
}

Result<std::string> LocalFileAccess::resolveReference(const std::string& reference) {
    std::string path = stripScheme(reference);
    if (path.empty()) {
        return Error{ErrorCode::FileNotFound, "empty file reference", "LocalFileAccess"};
    }

    if (fs::is_regular_file(path)) {
        if (::access(path.c_str(), R_OK) != 0) {
            return Error{ErrorCode::FileNotFound, "no read access to " + path, "LocalFileAccess"};
        }
        return path;
    }

    // Download targets may not exist yet; their directory must
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) {
        parent = ".";
    }
    std::error_code ec;
    if (fs::is_directory(parent, ec) && ::access(parent.c_str(), W_OK) == 0) {
        return path;
    }
    return Error{ErrorCode::FileNotFound, "cannot resolve " + reference, "LocalFileAccess"};
}

std::string LocalFileAccess::makeReference(const std::string& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    return ec ? path : absolute.lexically_normal().string();
}

} // namespace ChatStorage
