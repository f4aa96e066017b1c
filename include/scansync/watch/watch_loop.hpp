#pragma once

#include "scansync/core/cancellation.hpp"
#include "scansync/core/result.hpp"
#include "scansync/events/event_bus.hpp"
#include "scansync/upload/coordinator.hpp"
#include "scansync/upload/ignore_filter.hpp"
#include "scansync/watch/event_source.hpp"

#include <chrono>
#include <filesystem>

namespace scansync::watch {

struct WatchOptions {
    bool initial_sweep = true;
    std::chrono::milliseconds wait_slice{100};          ///< Longest uninterrupted wait on the source
    std::chrono::milliseconds idle_log_interval{1000};  ///< Quiet time before re-logging "Waiting..."
};

/**
 * @brief Single dispatcher for one watched directory
 *
 * Sweeps the directory once, then turns write events into upload tasks
 * for as long as the source produces them. Tasks are scheduled on the
 * coordinator and never awaited here.
 */
class WatchLoop {
public:
    WatchLoop(std::filesystem::path directory,
              DirectoryEventSource& source,
              upload::UploadCoordinator& coordinator,
              const upload::IgnoreFilter& filter,
              events::EventBus& bus,
              WatchOptions options = {});

    /**
     * @brief Sweep, then dispatch until closed, failed or cancelled
     *
     * RETURNS:
     * - Ok when the source's stream is closed
     * - the source's error when it fails
     * - Cancelled when token fires
     */
    Result<void> run(const CancellationToken& token);

    /**
     * @brief Schedule every eligible file already in the directory
     */
    Result<void> sweep(const CancellationToken& token);

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    void dispatch(const WatchEvent& event, const CancellationToken& token);

    const std::filesystem::path directory_;
    DirectoryEventSource& source_;
    upload::UploadCoordinator& coordinator_;
    const upload::IgnoreFilter& filter_;
    events::EventBus& bus_;
    WatchOptions options_;
};

} // namespace scansync::watch
