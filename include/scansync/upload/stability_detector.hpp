#pragma once

#include "scansync/core/cancellation.hpp"
#include "scansync/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>

namespace scansync::upload {

struct StabilityOptions {
    std::chrono::milliseconds poll_interval{1000};
    std::uint32_t required_samples = 10; ///< Consecutive equal samples after the baseline
};

/**
 * @brief Counts consecutive equal size samples
 *
 * The first sample only establishes the baseline. Any change resets the
 * count and becomes the new baseline, so a writer that stalls and then
 * resumes never accumulates stability across the stall.
 */
class StabilityTracker {
public:
    explicit StabilityTracker(std::uint32_t required_samples) : required_(required_samples) {}

    /**
     * @brief Record one sample
     *
     * RETURNS: true once the size has been unchanged for required_samples
     */
    bool observe(std::uint64_t size);

    [[nodiscard]] std::uint32_t consecutive() const noexcept { return consecutive_; }
    [[nodiscard]] std::optional<std::uint64_t> last_size() const noexcept { return last_size_; }

private:
    std::uint32_t required_;
    std::uint32_t consecutive_ = 0;
    std::optional<std::uint64_t> last_size_;
};

/**
 * @brief Polls a file until its size stops changing
 */
class FileStabilityDetector {
public:
    using SizeSampler = std::function<Result<std::uint64_t>(const std::filesystem::path&)>;

    explicit FileStabilityDetector(StabilityOptions options = {}, SizeSampler sampler = {});

    /**
     * @brief Block until path is stable, a stat fails, or token is cancelled
     */
    Result<void> wait_until_stable(const std::filesystem::path& path,
                                   const CancellationToken& token) const;

    [[nodiscard]] const StabilityOptions& options() const noexcept { return options_; }

    static Result<std::uint64_t> stat_file_size(const std::filesystem::path& path);

private:
    StabilityOptions options_;
    SizeSampler sampler_;
};

} // namespace scansync::upload
