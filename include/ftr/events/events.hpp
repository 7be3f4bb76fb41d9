/**
 * @file events.hpp
 * @brief Event type definitions for the file-transfer relay
 *
 * NAMING CONVENTION:
 * - Events are past-tense: TransferCompletedEvent, FileRemovedEvent
 */

#pragma once

#include "ftr/core/status.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace ftr::events {

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when the RPC server starts accepting connections
 *
 * WHO EMITS: main() startup
 */
struct ServerStartedEvent {
    uint16_t port;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerStartedEvent(uint16_t p)
        : port(p),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted when the server is shutting down
 *
 * WHO EMITS: main() signal handler path
 */
struct ServerShuttingDownEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerShuttingDownEvent(std::string r = "normal")
        : reason(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

// ════════════════════════════════════════════════════════
// Transfer Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when a TransferToRemote request passes validation
 *
 * route is "local" or "dpu:<index>"
 */
struct TransferStartedEvent {
    std::string destination;
    std::string url;
    std::string route;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct TransferCompletedEvent {
    std::string destination;
    std::string route;
    std::uint64_t total_bytes = 0;
    std::string hash;  ///< hex
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct TransferFailedEvent {
    std::string destination;
    std::string route;
    StatusCode code = StatusCode::Internal;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Put / Remove Events
// ════════════════════════════════════════════════════════

struct PutCompletedEvent {
    std::string file_path;
    std::uint64_t total_bytes = 0;
    std::string hash;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct PutFailedEvent {
    std::string file_path;
    StatusCode code = StatusCode::Internal;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FileRemovedEvent {
    std::string file_path;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// DPU Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when the connection cache dials a new DPU channel
 */
struct DpuConnectionDialedEvent {
    std::string dpu_id;
    std::string address;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace ftr::events
