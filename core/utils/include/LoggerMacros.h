/**
 * @file LoggerMacros.h
 * @brief Logging macros for hot paths
 *
 * Per-frame and per-chunk logging goes through these so the message string
 * is only built when the level is enabled.
 */

#pragma once

#include "Logger.h"
#include <chrono>
#include <string>

namespace ChatStorage {

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::ChatStorage::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define LOG_INFO_COMP(msg, component) ::ChatStorage::Logger::instance().info(msg, component)
#define LOG_WARN_COMP(msg, component) ::ChatStorage::Logger::instance().warn(msg, component)
#define LOG_ERROR_COMP(msg, component) ::ChatStorage::Logger::instance().error(msg, component)

// Logs elapsed time at DEBUG level on destruction
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name, const std::string& component = "Performance")
        : name_(name), component_(component), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto end = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start_).count();

        auto& logger = Logger::instance();
        if (logger.isDebugEnabled()) {
            logger.debug(name_ + " took " + std::to_string(duration) + "ms", component_);
        }
    }

private:
    std::string name_;
    std::string component_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace ChatStorage
