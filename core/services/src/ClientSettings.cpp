#include "ClientSettings.h"

#include <cstdlib>

namespace ChatStorage {

namespace {

bool parsesAsLong(const std::string& value, long min, long max) {
    if (value.empty()) return false;
    char* end = nullptr;
    long parsed = std::strtol(value.c_str(), &end, 10);
    return end && *end == '\0' && parsed >= min && parsed <= max;
}

Config::Validator port() {
    return [](const std::string&, const std::string& value) { return parsesAsLong(value, 1, 65535); };
}

Config::Validator atLeast(long min) {
    return [min](const std::string&, const std::string& value) { return parsesAsLong(value, min, 0x7fffffffL); };
}

} // namespace

ClientSettings ClientSettings::fromConfig(const Config& cfg) {
    ClientSettings s;
    s.host = cfg.get("server.host", config::DEFAULT_SERVER_HOST);
    s.controlPort = cfg.getInt("server.control_port", config::DEFAULT_CONTROL_PORT);

    s.control.name = "control";
    s.control.heartbeatIntervalMs = cfg.getInt("connection.heartbeat_interval_ms", config::HEARTBEAT_INTERVAL_MS);
    s.control.reconnectDelayMs = cfg.getInt("connection.reconnect_delay_ms", config::RECONNECT_DELAY_MS);
    s.control.maxReconnectAttempts = cfg.getInt("connection.max_reconnect_attempts", config::MAX_RECONNECT_ATTEMPTS);
    s.control.connectTimeoutMs = cfg.getInt("connection.connect_timeout_ms", config::CONNECT_TIMEOUT_MS);
    s.requestTimeoutMs = cfg.getInt("request.timeout_ms", config::REQUEST_TIMEOUT_MS);
    s.control.sendTimeoutMs = s.requestTimeoutMs;

    SchedulerOptions& sched = s.scheduler;
    sched.host = s.host;
    sched.uploadPort = cfg.getInt("server.upload_port", config::DEFAULT_UPLOAD_PORT);
    sched.downloadPort = cfg.getInt("server.download_port", config::DEFAULT_DOWNLOAD_PORT);
    sched.maxConcurrent = cfg.getInt("transfer.max_concurrent", config::MAX_CONCURRENT_TRANSFERS);
    sched.connection = s.control;

    TransferOptions& transfer = sched.transfer;
    transfer.chunkSize = cfg.getSize("transfer.chunk_size", config::TRANSFER_CHUNK_SIZE);
    transfer.writeHighWater = cfg.getSize("transfer.write_high_water", config::WRITE_HIGH_WATER);
    transfer.writeLowWater = cfg.getSize("transfer.write_low_water", config::WRITE_LOW_WATER);
    transfer.progressIntervalMs = cfg.getInt("transfer.progress_interval_ms", config::PROGRESS_INTERVAL_MS);
    transfer.idleTimeoutMs = cfg.getInt("transfer.idle_timeout_ms", config::TRANSFER_IDLE_TIMEOUT_MS);
    transfer.requestTimeoutMs = s.requestTimeoutMs;

    s.dbPath = cfg.get("storage.db_path", "");
    s.logLevel = cfg.get("log.level", "info");
    s.logFile = cfg.get("log.file", "");
    return s;
}

std::unordered_map<std::string, Config::Validator> ClientSettings::schema() {
    return {
        {"server.control_port", port()},
        {"server.upload_port", port()},
        {"server.download_port", port()},
        {"connection.heartbeat_interval_ms", atLeast(0)},
        {"connection.reconnect_delay_ms", atLeast(0)},
        {"connection.max_reconnect_attempts", atLeast(0)},
        {"connection.connect_timeout_ms", atLeast(1)},
        {"request.timeout_ms", atLeast(1)},
        {"transfer.chunk_size", atLeast(1)},
        {"transfer.max_concurrent", atLeast(1)},
        {"transfer.write_high_water", atLeast(1)},
        {"transfer.write_low_water", atLeast(0)},
        {"transfer.progress_interval_ms", atLeast(0)},
        {"transfer.idle_timeout_ms", atLeast(1)},
    };
}

} // namespace ChatStorage
