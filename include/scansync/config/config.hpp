#pragma once

#include "scansync/core/result.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace scansync::config {

/**
 * @brief Runtime settings for the uploader daemon
 *
 * Defaults match an unattended scanner share. A JSON file may override
 * any field and command-line flags override the file.
 */
struct Config {
    std::filesystem::path input_dir = "/share/Scans";   ///< Directory to watch for new files
    std::string output_dir = "Incoming Scans";          ///< Destination folder name in the store
    std::filesystem::path store_root;                   ///< Root of the mounted remote tree
    bool upload_on_startup = true;                      ///< Sweep files already present at startup
    std::chrono::milliseconds poll_interval{1000};
    std::uint32_t stable_samples = 10;
    std::vector<std::string> ignore_names{".DS_Store"};
    std::string open_handle_command = "lsof";
    std::string log_level = "info";
};

Result<Config> from_json(const nlohmann::json& document, Config base = {});

Result<Config> load_file(const std::filesystem::path& path, Config base = {});

/**
 * @brief Apply command-line flags on top of base
 *
 * Recognized: --config <file>, --input_dir, --output_dir, --store_root,
 * --upload_on_startup <true|false>, --log_level. --config is applied
 * first so explicit flags win regardless of order.
 */
Result<Config> parse_args(int argc, const char* const argv[], Config base = {});

Result<void> validate(const Config& config);

std::string usage(const std::string& program);

} // namespace scansync::config
