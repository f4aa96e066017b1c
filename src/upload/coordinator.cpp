#include "scansync/upload/coordinator.hpp"

#include "scansync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <fstream>
#include <system_error>
#include <thread>

namespace scansync::upload {
namespace fs = std::filesystem;

const char* upload_state_name(UploadState state) {
    switch (state) {
        case UploadState::Unclaimed: return "unclaimed";
        case UploadState::Claimed: return "claimed";
        case UploadState::Stabilizing: return "stabilizing";
        case UploadState::ClosedCheck: return "closed-check";
        case UploadState::Uploading: return "uploading";
        case UploadState::Deleting: return "deleting";
        case UploadState::Done: return "done";
        case UploadState::Failed: return "failed";
    }
    return "unknown";
}

UploadCoordinator::UploadCoordinator(std::shared_ptr<remote::RemoteStore> store,
                                     remote::FolderRef folder,
                                     FileStabilityDetector stability,
                                     std::shared_ptr<OpenHandleProbe> probe,
                                     events::EventBus& bus)
    : store_(std::move(store)),
      folder_(std::move(folder)),
      stability_(std::move(stability)),
      probe_(std::move(probe)),
      bus_(bus) {}

UploadCoordinator::~UploadCoordinator() {
    wait_idle();
}

void UploadCoordinator::schedule(const fs::path& path, const CancellationToken& token) {
    {
        std::lock_guard lock(tasks_mutex_);
        ++active_tasks_;
    }

    try {
        std::thread([this, path, token]() {
            try {
                process(path, token);
            } catch (const std::exception& e) {
                spdlog::error("upload task for {} aborted: {}", path.string(), e.what());
            }
            task_finished();
        }).detach();
    } catch (const std::system_error& e) {
        spdlog::error("failed to start upload task for {}: {}", path.string(), e.what());
        task_finished();
    }
}

TaskOutcome UploadCoordinator::process(const fs::path& path, const CancellationToken& token) {
    PathClaim claim(in_flight_, path.string());
    if (!claim.held()) {
        spdlog::debug("{} is already being processed", path.string());
        return TaskOutcome::Duplicate;
    }
    spdlog::debug("[{}] {}", upload_state_name(UploadState::Claimed), path.string());

    spdlog::debug("[{}] {}", upload_state_name(UploadState::Stabilizing), path.string());
    if (auto stable = stability_.wait_until_stable(path, token); stable.is_error()) {
        return fail(path, UploadState::Stabilizing, stable.error());
    }

    spdlog::debug("[{}] {}", upload_state_name(UploadState::ClosedCheck), path.string());
    if (auto closed = probe_->wait_until_closed(path, token); closed.is_error()) {
        return fail(path, UploadState::ClosedCheck, closed.error());
    }

    spdlog::debug("[{}] {}", upload_state_name(UploadState::Uploading), path.string());
    if (auto uploaded = upload_file(path, token); uploaded.is_error()) {
        return fail(path, UploadState::Uploading, uploaded.error());
    }

    // The remote copy is authoritative from here on; a failed delete is
    // reported and left alone.
    spdlog::info("Removing {}", path.string());
    std::error_code ec;
    const bool removed = fs::remove(path, ec);
    if (ec) {
        spdlog::error("failed to delete file {}: {}", path.string(), ec.message());
        bus_.emit(events::LocalCleanupFailedEvent{path.string(), ec.message()});
    } else if (!removed) {
        spdlog::warn("{} was already gone after upload", path.string());
    } else {
        bus_.emit(events::LocalFileRemovedEvent{path.string()});
    }

    spdlog::debug("[{}] {}", upload_state_name(UploadState::Done), path.string());
    return TaskOutcome::Uploaded;
}

Result<std::uint64_t> UploadCoordinator::upload_file(const fs::path& path, const CancellationToken& token) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::uint64_t>(ErrorCode::Io, "failed to open " + path.string());
    }

    std::error_code ec;
    const auto size = static_cast<std::uint64_t>(fs::file_size(path, ec));
    if (ec) {
        return Err<std::uint64_t>(ErrorCode::Io, "stat " + path.string() + ": " + ec.message());
    }

    bus_.emit(events::UploadStartedEvent{path.string(), folder_.name, size});
    const auto started = std::chrono::steady_clock::now();

    const remote::UploadSource source{path.filename().string(), input, size};
    const std::string file_path = path.string();
    auto progress = [this, &file_path](std::uint64_t sent, std::uint64_t total) {
        bus_.emit(events::UploadProgressEvent{file_path, sent, total});
    };

    auto result = store_->upload(source, folder_, progress, token);
    if (result.is_error()) {
        return Err<std::uint64_t>(result.error());
    }

    events::UploadCompletedEvent completed;
    completed.file_path = file_path;
    completed.folder = folder_.name;
    completed.total_bytes = size;
    completed.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    bus_.emit(completed);
    return Ok(size);
}

TaskOutcome UploadCoordinator::fail(const fs::path& path, UploadState stage, const Error& error) {
    events::UploadFailedEvent failed;
    failed.file_path = path.string();
    failed.stage = upload_state_name(stage);
    failed.error_message = error.message;
    failed.cancelled = error.is_cancelled();
    if (failed.cancelled) {
        spdlog::info("Abandoned {} while {}: {}", failed.file_path, failed.stage, failed.error_message);
    } else {
        spdlog::error("failed {} file {}: {}", failed.stage, failed.file_path, failed.error_message);
    }
    bus_.emit(failed);

    return failed.cancelled ? TaskOutcome::Cancelled : TaskOutcome::Failed;
}

bool UploadCoordinator::is_in_flight(const fs::path& path) const {
    return in_flight_.is_claimed(path.string());
}

void UploadCoordinator::wait_idle() {
    std::unique_lock lock(tasks_mutex_);
    tasks_cv_.wait(lock, [this]() { return active_tasks_ == 0; });
}

std::size_t UploadCoordinator::active_tasks() const {
    std::lock_guard lock(tasks_mutex_);
    return active_tasks_;
}

void UploadCoordinator::task_finished() {
    std::lock_guard lock(tasks_mutex_);
    if (--active_tasks_ == 0) {
        tasks_cv_.notify_all();
    }
}

} // namespace scansync::upload
