#pragma once

/**
 * @file Constants.h
 * @brief Centralized default values for the ChatStorage client engine
 *
 * Every threshold here is only a default; ClientSettings reads the
 * overriding value from Config.
 */

#include <cstddef>
#include <cstdint>

namespace ChatStorage::config {

// =============================================================================
// Wire Protocol
// =============================================================================

/// Frame magic, first two bytes of every frame
constexpr std::uint16_t FRAME_MAGIC = 0xFACE;

/// magic(2) + type(1) + flags(1) + length(4)
constexpr std::size_t FRAME_HEADER_SIZE = 8;

/// Largest payload a stream header may declare; larger lengths are treated as corruption
constexpr std::uint32_t MAX_FRAME_PAYLOAD = 64u * 1024u * 1024u;

// =============================================================================
// Server Endpoints
// =============================================================================

constexpr const char* DEFAULT_SERVER_HOST = "127.0.0.1";

/// Control channel (auth, friends, directories, file listing)
constexpr int DEFAULT_CONTROL_PORT = 10086;

/// Dedicated port for upload transfer connections
constexpr int DEFAULT_UPLOAD_PORT = 10087;

/// Dedicated port for download transfer connections
constexpr int DEFAULT_DOWNLOAD_PORT = 10088;

// =============================================================================
// Connection
// =============================================================================

/// Socket read buffer (bytes)
constexpr std::size_t RECEIVE_BUFFER_SIZE = 4096;

/// Heartbeat interval on the control connection (milliseconds)
constexpr int HEARTBEAT_INTERVAL_MS = 30000;

/// Fixed delay between reconnect attempts (milliseconds)
constexpr int RECONNECT_DELAY_MS = 5000;

/// Reconnect attempts before the connection is declared failed
constexpr int MAX_RECONNECT_ATTEMPTS = 5;

/// TCP connect timeout (milliseconds)
constexpr int CONNECT_TIMEOUT_MS = 5000;

// =============================================================================
// Request / Response
// =============================================================================

/// Default one-shot request timeout (milliseconds)
constexpr int REQUEST_TIMEOUT_MS = 10000;

/// Directory tree listing is slower server-side
constexpr int DIRECTORY_LIST_TIMEOUT_MS = 15000;

// =============================================================================
// Transfers
// =============================================================================

/// Upload chunk size (bytes)
constexpr std::size_t TRANSFER_CHUNK_SIZE = 8 * 1024;

/// Maximum concurrently executing transfers
constexpr int MAX_CONCURRENT_TRANSFERS = 5;

/// Download write queue pauses intake above this many buffered bytes
constexpr std::size_t WRITE_HIGH_WATER = 4 * 1024 * 1024;

/// Download write queue resumes intake below this many buffered bytes
constexpr std::size_t WRITE_LOW_WATER = 1 * 1024 * 1024;

/// Progress callback / checkpoint throttle (milliseconds)
constexpr int PROGRESS_INTERVAL_MS = 500;

/// Download fails when no frame arrives for this long (milliseconds)
constexpr int TRANSFER_IDLE_TIMEOUT_MS = 30000;

/// Granularity of cancellation-aware waits (milliseconds)
constexpr int WAIT_SLICE_MS = 100;

/// Write queue diagnostics sampling period (milliseconds)
constexpr int DIAGNOSTICS_INTERVAL_MS = 2000;

/// Fingerprint column marker identifying persisted download tasks
constexpr const char* DOWNLOAD_MARKER_PREFIX = "DOWNLOAD_FILE_ID_";

// =============================================================================
// Logging / Storage
// =============================================================================

/// Maximum log file size (MB)
constexpr std::size_t MAX_LOG_FILE_SIZE_MB = 100;

/// SQLite busy timeout (milliseconds)
constexpr int DB_BUSY_TIMEOUT_MS = 5000;

} // namespace ChatStorage::config
