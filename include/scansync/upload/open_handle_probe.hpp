#pragma once

#include "scansync/core/cancellation.hpp"
#include "scansync/core/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace scansync::upload {

/**
 * @brief Captured result of one run of the open-handle utility
 */
struct ProbeOutput {
    int exit_code = 0;
    std::string std_out;
    std::string std_err;
};

/**
 * @brief Map lsof-style output onto open / closed / error
 *
 * - exit 0 with output          -> open
 * - exit 0 without output       -> closed
 * - non-zero exit, empty stderr -> closed (lsof found no holder)
 * - non-zero exit with stderr   -> ProbeFailed error
 */
Result<bool> interpret_probe_output(const ProbeOutput& output);

/**
 * @brief Answers "does any process hold this file open?"
 *
 * Implementations must report infrastructure failures as errors; a
 * probe that cannot run never counts as "closed".
 */
class OpenHandleProbe {
public:
    explicit OpenHandleProbe(std::chrono::milliseconds poll_interval = std::chrono::seconds(1))
        : poll_interval_(poll_interval) {}

    virtual ~OpenHandleProbe() = default;

    virtual Result<bool> is_open(const std::filesystem::path& path,
                                 const CancellationToken& token) = 0;

    /**
     * @brief Poll is_open() until it reports closed
     *
     * Propagates the first probe error and returns Cancelled if token
     * fires between polls.
     */
    Result<void> wait_until_closed(const std::filesystem::path& path,
                                   const CancellationToken& token);

    [[nodiscard]] std::chrono::milliseconds poll_interval() const noexcept { return poll_interval_; }

private:
    std::chrono::milliseconds poll_interval_;
};

/**
 * @brief Probe backed by `lsof -w -F p <path>`
 *
 * The child process runs under a private io_context so its output can be
 * collected while the cancellation token is watched; cancelling
 * terminates the child.
 */
class LsofProbe : public OpenHandleProbe {
public:
    explicit LsofProbe(std::string command = "lsof",
                       std::chrono::milliseconds poll_interval = std::chrono::seconds(1));

    Result<bool> is_open(const std::filesystem::path& path,
                         const CancellationToken& token) override;

    [[nodiscard]] const std::string& command() const noexcept { return command_; }

private:
    Result<std::string> resolve_executable() const;

    std::string command_;
};

} // namespace scansync::upload
