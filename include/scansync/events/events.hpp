/**
 * @file events.hpp
 * @brief Upload lifecycle events
 *
 * WHY THIS FILE EXISTS:
 * The dispatcher and the upload tasks report what happens to each file
 * through these events. Logging and metrics subscribe to them instead of
 * being wired into the coordinator.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: UploadStartedEvent, LocalFileRemovedEvent
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace scansync::events {

// ════════════════════════════════════════════════════════
// Watch Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when the dispatcher schedules a file for upload
 *
 * WHO EMITS: WatchLoop (initial sweep and live events)
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct FileDiscoveredEvent {
    std::string file_path;
    std::string source;  // "sweep", "watch"
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted once when the dispatcher starts consuming live events
 */
struct WatchStartedEvent {
    std::string directory;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when the dispatcher returns
 */
struct WatchStoppedEvent {
    std::string directory;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Upload Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when a stable, closed file starts uploading
 *
 * WHO EMITS: UploadCoordinator
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct UploadStartedEvent {
    std::string file_path;
    std::string folder;
    std::uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Incremental progress reported by the remote store
 *
 * Observability only. Nothing in the upload path depends on it.
 */
struct UploadProgressEvent {
    std::string file_path;
    std::uint64_t bytes_sent = 0;
    std::uint64_t total_bytes = 0;
};

struct UploadCompletedEvent {
    std::string file_path;
    std::string folder;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when a task gives up on a file
 *
 * stage names the step that failed ("stabilizing", "closed-check",
 * "uploading"). The file is left in place for a later event.
 */
struct UploadFailedEvent {
    std::string file_path;
    std::string stage;
    std::string error_message;
    bool cancelled = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Cleanup Events
// ════════════════════════════════════════════════════════

struct LocalFileRemovedEvent {
    std::string file_path;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Local delete failed after a confirmed upload
 *
 * The remote copy is authoritative; this is reported, never retried.
 */
struct LocalCleanupFailedEvent {
    std::string file_path;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace scansync::events
