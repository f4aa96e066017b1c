#pragma once

#include "scansync/config/config.hpp"
#include "scansync/core/cancellation.hpp"
#include "scansync/core/result.hpp"
#include "scansync/events/event_bus.hpp"
#include "scansync/remote/remote_store.hpp"
#include "scansync/upload/coordinator.hpp"
#include "scansync/upload/ignore_filter.hpp"
#include "scansync/upload/open_handle_probe.hpp"
#include "scansync/watch/event_source.hpp"
#include "scansync/watch/watch_loop.hpp"

#include <filesystem>
#include <memory>

namespace scansync::service {

/**
 * @brief Watches one directory and moves every finished file to the store
 */
class Uploader {
public:
    /**
     * @brief Start watching config.input_dir and resolve config.output_dir
     *
     * Fails if the directory cannot be watched or the destination folder
     * cannot be resolved. probe defaults to an LsofProbe built from config.
     */
    static Result<std::unique_ptr<Uploader>> create(const config::Config& config,
                                                    std::shared_ptr<remote::RemoteStore> store,
                                                    std::unique_ptr<watch::DirectoryEventSource> source,
                                                    events::EventBus& bus,
                                                    std::shared_ptr<upload::OpenHandleProbe> probe = nullptr);

    /**
     * @brief Waits for outstanding upload tasks after closing the watch
     */
    ~Uploader();

    Uploader(const Uploader&) = delete;
    Uploader& operator=(const Uploader&) = delete;

    /**
     * @brief Block until cancelled, the source closes, or the source fails
     */
    Result<void> run(const CancellationToken& token);

    /**
     * @brief Run with cancel's token, then cancel it once the watch ends
     *
     * Once this returns no upload task is left waiting on a file, so
     * destroying the uploader does not block on a writer that never
     * lets go.
     */
    Result<void> run_until_done(CancellationSource& cancel);

    /**
     * @brief Release the directory watch. Idempotent.
     */
    void close();

    [[nodiscard]] const std::filesystem::path& input_dir() const noexcept { return input_dir_; }
    [[nodiscard]] const remote::FolderRef& folder() const noexcept { return coordinator_->folder(); }

    upload::UploadCoordinator& coordinator() noexcept { return *coordinator_; }

private:
    Uploader(std::filesystem::path input_dir,
             std::unique_ptr<watch::DirectoryEventSource> source,
             std::unique_ptr<upload::UploadCoordinator> coordinator,
             upload::IgnoreFilter filter,
             events::EventBus& bus,
             watch::WatchOptions options);

    std::filesystem::path input_dir_;
    std::unique_ptr<watch::DirectoryEventSource> source_;
    std::unique_ptr<upload::UploadCoordinator> coordinator_;
    upload::IgnoreFilter filter_;
    watch::WatchLoop loop_;
};

} // namespace scansync::service
