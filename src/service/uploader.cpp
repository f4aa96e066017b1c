#include "scansync/service/uploader.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace scansync::service {
namespace fs = std::filesystem;

Result<std::unique_ptr<Uploader>> Uploader::create(const config::Config& config,
                                                   std::shared_ptr<remote::RemoteStore> store,
                                                   std::unique_ptr<watch::DirectoryEventSource> source,
                                                   events::EventBus& bus,
                                                   std::shared_ptr<upload::OpenHandleProbe> probe) {
    using UploaderPtr = std::unique_ptr<Uploader>;

    if (!store || !source) {
        return Err<UploaderPtr>(ErrorCode::InvalidConfig, "uploader needs a remote store and an event source");
    }

    std::error_code ec;
    fs::path input_dir = fs::absolute(config.input_dir, ec).lexically_normal();
    if (ec) {
        return Err<UploaderPtr>(ErrorCode::WatchFailed, "invalid input directory " + config.input_dir.string());
    }
    // Events name files as <dir>/<name>; keep sweep paths in the same form.
    if (!input_dir.has_filename() && input_dir.has_parent_path()) {
        input_dir = input_dir.parent_path();
    }

    if (auto added = source->add(input_dir); added.is_error()) {
        source->close();
        return Err<UploaderPtr>(added.error());
    }

    auto folder = store->resolve_folder(config.output_dir);
    if (folder.is_error()) {
        source->close();
        return Err<UploaderPtr>(folder.error());
    }
    spdlog::info("Uploading files from {} to folder {} ({})",
                 input_dir.string(), folder.value().name, folder.value().id);

    if (!probe) {
        probe = std::make_shared<upload::LsofProbe>(config.open_handle_command, config.poll_interval);
    }

    upload::StabilityOptions stability;
    stability.poll_interval = config.poll_interval;
    stability.required_samples = config.stable_samples;

    auto coordinator = std::make_unique<upload::UploadCoordinator>(
        std::move(store), folder.value(), upload::FileStabilityDetector(stability), std::move(probe), bus);

    watch::WatchOptions options;
    options.initial_sweep = config.upload_on_startup;

    return Ok(UploaderPtr(new Uploader(std::move(input_dir),
                                       std::move(source),
                                       std::move(coordinator),
                                       upload::IgnoreFilter(config.ignore_names),
                                       bus,
                                       options)));
}

Uploader::Uploader(fs::path input_dir,
                   std::unique_ptr<watch::DirectoryEventSource> source,
                   std::unique_ptr<upload::UploadCoordinator> coordinator,
                   upload::IgnoreFilter filter,
                   events::EventBus& bus,
                   watch::WatchOptions options)
    : input_dir_(std::move(input_dir)),
      source_(std::move(source)),
      coordinator_(std::move(coordinator)),
      filter_(std::move(filter)),
      loop_(input_dir_, *source_, *coordinator_, filter_, bus, options) {}

Uploader::~Uploader() {
    close();
    coordinator_->wait_idle();
}

Result<void> Uploader::run(const CancellationToken& token) {
    return loop_.run(token);
}

Result<void> Uploader::run_until_done(CancellationSource& cancel) {
    auto result = run(cancel.token());
    if (!cancel.is_cancelled()) {
        spdlog::info("Watch ended, abandoning outstanding uploads");
        cancel.cancel();
    }
    close();
    return result;
}

void Uploader::close() {
    source_->close();
}

} // namespace scansync::service
