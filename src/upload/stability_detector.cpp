#include "scansync/upload/stability_detector.hpp"

#include "scansync/core/interval_poll.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace scansync::upload {
namespace fs = std::filesystem;

bool StabilityTracker::observe(std::uint64_t size) {
    if (last_size_.has_value() && *last_size_ == size) {
        ++consecutive_;
    } else {
        // Growth (or first sample): restart the count from this size.
        consecutive_ = 0;
        last_size_ = size;
    }
    return consecutive_ >= required_;
}

FileStabilityDetector::FileStabilityDetector(StabilityOptions options, SizeSampler sampler)
    : options_(options),
      sampler_(sampler ? std::move(sampler) : SizeSampler(&FileStabilityDetector::stat_file_size)) {}

Result<void> FileStabilityDetector::wait_until_stable(const fs::path& path,
                                                      const CancellationToken& token) const {
    spdlog::info("Waiting for {} to stop growing...", path.string());

    StabilityTracker tracker(options_.required_samples);
    return poll_every(options_.poll_interval, token, [&]() -> Result<bool> {
        auto size = sampler_(path);
        if (size.is_error()) {
            return Err<bool>(size.error());
        }
        return Ok(tracker.observe(size.value()));
    });
}

Result<std::uint64_t> FileStabilityDetector::stat_file_size(const fs::path& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        const auto code = ec == std::errc::no_such_file_or_directory ? ErrorCode::NotFound : ErrorCode::Io;
        return Err<std::uint64_t>(code, "stat " + path.string() + ": " + ec.message());
    }
    return Ok(static_cast<std::uint64_t>(size));
}

} // namespace scansync::upload
