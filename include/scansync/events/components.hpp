/**
 * @file components.hpp
 * @brief Observers of the upload lifecycle
 *
 * WHY THIS FILE EXISTS:
 * Keeps logging and counting out of the upload engine. The coordinator
 * and dispatcher only emit events; these components decide what to do
 * with them.
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 */

#pragma once

#include "scansync/core/units.hpp"
#include "scansync/events/event_bus.hpp"
#include "scansync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace scansync::events {

/**
 * @brief Logs upload lifecycle progress with spdlog
 *
 * Failures are not repeated here; the coordinator logs them itself.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<WatchStartedEvent>([](const WatchStartedEvent& e) {
            spdlog::info("Watching {} for new files", e.directory);
        });

        bus_.subscribe<WatchStoppedEvent>([](const WatchStoppedEvent& e) {
            spdlog::info("Stopped watching {}: {}", e.directory, e.reason);
        });

        bus_.subscribe<FileDiscoveredEvent>([](const FileDiscoveredEvent& e) {
            spdlog::info("Found new file: {} ({})", e.file_path, e.source);
        });

        bus_.subscribe<UploadStartedEvent>([](const UploadStartedEvent& e) {
            spdlog::info("Uploading file: {} ({}) to {}",
                         e.file_path, human_bytes(e.total_bytes), e.folder);
        });

        bus_.subscribe<UploadProgressEvent>([](const UploadProgressEvent& e) {
            spdlog::debug("uploaded {}/{} of {}",
                          human_bytes(e.bytes_sent), human_bytes(e.total_bytes), e.file_path);
        });

        bus_.subscribe<UploadCompletedEvent>([](const UploadCompletedEvent& e) {
            spdlog::info("Uploaded {} ({}) to {} in {}ms",
                         e.file_path, human_bytes(e.total_bytes), e.folder, e.duration.count());
        });

        bus_.subscribe<LocalFileRemovedEvent>([](const LocalFileRemovedEvent& e) {
            spdlog::info("Removed {}", e.file_path);
        });
    }

private:
    EventBus& bus_;
};

/**
 * @brief Metrics component - counts uploads for the shutdown summary
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> files_discovered{0};
        std::atomic<uint64_t> uploads_started{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_failed{0};
        std::atomic<uint64_t> uploads_cancelled{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> local_files_removed{0};
        std::atomic<uint64_t> cleanup_failures{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<FileDiscoveredEvent>([this](const FileDiscoveredEvent&) {
            stats_.files_discovered++;
        });

        bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent&) {
            stats_.uploads_started++;
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            stats_.uploads_completed++;
            stats_.bytes_uploaded += e.total_bytes;
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            if (e.cancelled) {
                stats_.uploads_cancelled++;
            } else {
                stats_.uploads_failed++;
            }
        });

        bus_.subscribe<LocalFileRemovedEvent>([this](const LocalFileRemovedEvent&) {
            stats_.local_files_removed++;
        });

        bus_.subscribe<LocalCleanupFailedEvent>([this](const LocalCleanupFailedEvent&) {
            stats_.cleanup_failures++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Files discovered:  {}", stats_.files_discovered.load());
        spdlog::info("  Uploads started:   {}", stats_.uploads_started.load());
        spdlog::info("  Uploads completed: {}", stats_.uploads_completed.load());
        spdlog::info("  Uploads failed:    {}", stats_.uploads_failed.load());
        spdlog::info("  Uploads cancelled: {}", stats_.uploads_cancelled.load());
        spdlog::info("  Bytes uploaded:    {}", human_bytes(stats_.bytes_uploaded.load()));
        spdlog::info("  Local removed:     {}", stats_.local_files_removed.load());
        spdlog::info("  Cleanup failures:  {}", stats_.cleanup_failures.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace scansync::events
