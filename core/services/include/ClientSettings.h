#pragma once

#include "Config.h"
#include "Connection.h"
#include "TransferScheduler.h"

#include <string>
#include <unordered_map>

namespace ChatStorage {

/**
 * @brief Typed view of the client configuration.
 *
 * Missing keys keep the defaults from Constants.h.
 */
struct ClientSettings {
    std::string host{config::DEFAULT_SERVER_HOST};
    int controlPort{config::DEFAULT_CONTROL_PORT};
    ConnectionOptions control;
    int requestTimeoutMs{config::REQUEST_TIMEOUT_MS};
    SchedulerOptions scheduler;
    std::string dbPath;
    std::string logLevel{"info"};
    std::string logFile;

    static ClientSettings fromConfig(const Config& cfg);

    /// Validators for every numeric key ClientSettings reads
    static std::unordered_map<std::string, Config::Validator> schema();
};

} // namespace ChatStorage
