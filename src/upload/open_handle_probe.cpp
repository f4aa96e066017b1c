#include "scansync/upload/open_handle_probe.hpp"

#include "scansync/core/interval_poll.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <future>
#include <system_error>
#include <vector>

namespace scansync::upload {
namespace fs = std::filesystem;
namespace bp = boost::process;

namespace {

// How often a running probe checks the cancellation token.
constexpr std::chrono::milliseconds kCancelCheckInterval{50};

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c) != 0; });
    auto end = std::find_if_not(text.rbegin(), text.rend(),
                                [](unsigned char c) { return std::isspace(c) != 0; }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

Result<bool> interpret_probe_output(const ProbeOutput& output) {
    if (output.exit_code == 0) {
        return Ok(!trim(output.std_out).empty());
    }

    const std::string diagnostic = trim(output.std_err);
    if (diagnostic.empty()) {
        return Ok(false);
    }
    return Err<bool>(ErrorCode::ProbeFailed,
                     "open-handle check exited with status " + std::to_string(output.exit_code) +
                     ": " + diagnostic);
}

Result<void> OpenHandleProbe::wait_until_closed(const fs::path& path, const CancellationToken& token) {
    spdlog::info("Waiting for {} to be closed...", path.string());

    return poll_every(poll_interval_, token, [&]() -> Result<bool> {
        auto open = is_open(path, token);
        if (open.is_error()) {
            return Err<bool>(open.error());
        }
        return Ok(!open.value());
    });
}

LsofProbe::LsofProbe(std::string command, std::chrono::milliseconds poll_interval)
    : OpenHandleProbe(poll_interval), command_(std::move(command)) {}

Result<std::string> LsofProbe::resolve_executable() const {
    if (command_.find('/') != std::string::npos) {
        std::error_code ec;
        if (!fs::exists(command_, ec)) {
            return Err<std::string>(ErrorCode::ProbeFailed, command_ + ": no such executable");
        }
        return Ok(command_);
    }

    const auto found = bp::search_path(command_);
    if (found.empty()) {
        return Err<std::string>(ErrorCode::ProbeFailed,
                                "exec: \"" + command_ + "\": executable file not found in PATH");
    }
    return Ok(found.string());
}

Result<bool> LsofProbe::is_open(const fs::path& path, const CancellationToken& token) {
    auto executable = resolve_executable();
    if (executable.is_error()) {
        return Err<bool>(executable.error());
    }

    boost::asio::io_context io;
    std::future<std::string> std_out;
    std::future<std::string> std_err;
    int exit_code = -1;
    std::error_code launch_ec;

    bp::child child(bp::exe = executable.value(),
                    bp::args = std::vector<std::string>{"-w", "-F", "p", path.string()},
                    bp::std_in.close(),
                    bp::std_out > std_out,
                    bp::std_err > std_err,
                    bp::on_exit = [&exit_code](int code, const std::error_code&) { exit_code = code; },
                    io,
                    launch_ec);
    if (launch_ec) {
        return Err<bool>(ErrorCode::ProbeFailed,
                         "failed to run " + executable.value() + ": " + launch_ec.message());
    }

    while (!io.stopped()) {
        io.run_for(kCancelCheckInterval);
        if (token.is_cancelled()) {
            std::error_code kill_ec;
            child.terminate(kill_ec);
            if (kill_ec) {
                spdlog::warn("failed to terminate {} probe for {}: {}",
                             command_, path.string(), kill_ec.message());
            }
            return Err<bool>(Error::cancelled());
        }
    }

    ProbeOutput output;
    output.exit_code = exit_code;
    output.std_out = std_out.get();
    output.std_err = std_err.get();
    spdlog::debug("{} {} exited {}", command_, path.string(), output.exit_code);
    return interpret_probe_output(output);
}

} // namespace scansync::upload
