#pragma once

#include "scansync/core/cancellation.hpp"
#include "scansync/core/result.hpp"
#include "scansync/events/event_bus.hpp"
#include "scansync/remote/remote_store.hpp"
#include "scansync/upload/in_flight_set.hpp"
#include "scansync/upload/open_handle_probe.hpp"
#include "scansync/upload/stability_detector.hpp"

#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>

namespace scansync::upload {

enum class UploadState {
    Unclaimed,
    Claimed,
    Stabilizing,
    ClosedCheck,
    Uploading,
    Deleting,
    Done,
    Failed
};

const char* upload_state_name(UploadState state);

enum class TaskOutcome {
    Duplicate, ///< Path already claimed by another task; nothing done
    Uploaded,  ///< Remote copy confirmed (local delete may still have failed)
    Failed,
    Cancelled
};

/**
 * @brief Drives each claimed path from "being written" to "uploaded and removed"
 *
 * One task per path: claim, wait for the size to settle, wait for every
 * writer to close it, upload, delete the local copy, release. Failures are
 * terminal for the task and leave the file where it is.
 *
 * THREAD SAFETY:
 * - schedule() and process() may be called from any thread
 * - The only state shared between tasks is the in-flight set
 */
class UploadCoordinator {
public:
    UploadCoordinator(std::shared_ptr<remote::RemoteStore> store,
                      remote::FolderRef folder,
                      FileStabilityDetector stability,
                      std::shared_ptr<OpenHandleProbe> probe,
                      events::EventBus& bus);

    /**
     * @brief Waits for outstanding tasks; cancel their token first to make this quick
     */
    ~UploadCoordinator();

    UploadCoordinator(const UploadCoordinator&) = delete;
    UploadCoordinator& operator=(const UploadCoordinator&) = delete;

    /**
     * @brief Start a detached task for path
     *
     * Returns immediately. The task shares nothing with the caller except
     * the in-flight set and token.
     */
    void schedule(const std::filesystem::path& path, const CancellationToken& token);

    /**
     * @brief Run one task for path on the calling thread
     */
    TaskOutcome process(const std::filesystem::path& path, const CancellationToken& token);

    [[nodiscard]] bool is_in_flight(const std::filesystem::path& path) const;

    /**
     * @brief Block until every scheduled task has returned
     */
    void wait_idle();

    [[nodiscard]] std::size_t active_tasks() const;

    [[nodiscard]] const remote::FolderRef& folder() const noexcept { return folder_; }

private:
    Result<std::uint64_t> upload_file(const std::filesystem::path& path, const CancellationToken& token);

    TaskOutcome fail(const std::filesystem::path& path, UploadState stage, const Error& error);

    void task_finished();

    std::shared_ptr<remote::RemoteStore> store_;
    const remote::FolderRef folder_;
    FileStabilityDetector stability_;
    std::shared_ptr<OpenHandleProbe> probe_;
    events::EventBus& bus_;

    InFlightSet in_flight_;

    mutable std::mutex tasks_mutex_;
    std::condition_variable tasks_cv_;
    std::size_t active_tasks_ = 0;
};

} // namespace scansync::upload
