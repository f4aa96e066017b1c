#include "scansync/config/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <limits>
#include <optional>
#include <sstream>

namespace scansync::config {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::optional<bool> parse_bool(const std::string& text) {
    if (text == "true" || text == "1" || text == "yes") {
        return true;
    }
    if (text == "false" || text == "0" || text == "no") {
        return false;
    }
    return std::nullopt;
}

} // namespace

Result<Config> from_json(const json& document, Config base) {
    if (!document.is_object()) {
        return Err<Config>(ErrorCode::InvalidConfig, "configuration must be a JSON object");
    }

    try {
        base.input_dir = document.value("input_dir", base.input_dir.string());
        base.output_dir = document.value("output_dir", base.output_dir);
        base.store_root = document.value("store_root", base.store_root.string());
        base.upload_on_startup = document.value("upload_on_startup", base.upload_on_startup);
        base.open_handle_command = document.value("open_handle_command", base.open_handle_command);
        base.log_level = document.value("log_level", base.log_level);

        const auto interval_ms = document.value("poll_interval_ms",
                                                static_cast<std::int64_t>(base.poll_interval.count()));
        if (interval_ms <= 0) {
            return Err<Config>(ErrorCode::InvalidConfig, "poll_interval_ms must be positive");
        }
        base.poll_interval = std::chrono::milliseconds(interval_ms);

        const auto samples = document.value("stable_samples", static_cast<std::int64_t>(base.stable_samples));
        if (samples <= 0) {
            return Err<Config>(ErrorCode::InvalidConfig, "stable_samples must be positive");
        }
        if (samples > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
            return Err<Config>(ErrorCode::InvalidConfig, "stable_samples is too large");
        }
        base.stable_samples = static_cast<std::uint32_t>(samples);

        if (document.contains("ignore_names")) {
            base.ignore_names = document.at("ignore_names").get<std::vector<std::string>>();
        }
    } catch (const json::exception& e) {
        return Err<Config>(ErrorCode::InvalidConfig, std::string("invalid configuration value: ") + e.what());
    }

    return Ok(std::move(base));
}

Result<Config> load_file(const fs::path& path, Config base) {
    std::ifstream input(path);
    if (!input) {
        return Err<Config>(ErrorCode::InvalidConfig, "unable to read config file " + path.string());
    }

    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return Err<Config>(ErrorCode::InvalidConfig, "config file " + path.string() + " is not valid JSON");
    }
    return from_json(document, std::move(base));
}

Result<Config> parse_args(int argc, const char* const argv[], Config base) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                return Err<Config>(ErrorCode::InvalidConfig, arg + " requires a value");
            }
            auto loaded = load_file(argv[i + 1], std::move(base));
            if (loaded.is_error()) {
                return loaded;
            }
            base = std::move(loaded.value());
            break;
        }
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (i + 1 >= argc) {
            return Err<Config>(ErrorCode::InvalidConfig, "unknown or incomplete argument: " + arg);
        }
        const std::string value = argv[++i];

        if (arg == "--config" || arg == "-c") {
            continue;
        } else if (arg == "--input_dir" || arg == "-i") {
            base.input_dir = value;
        } else if (arg == "--output_dir" || arg == "-o") {
            base.output_dir = value;
        } else if (arg == "--store_root" || arg == "-s") {
            base.store_root = value;
        } else if (arg == "--upload_on_startup") {
            auto flag = parse_bool(value);
            if (!flag) {
                return Err<Config>(ErrorCode::InvalidConfig, "--upload_on_startup expects true or false, got " + value);
            }
            base.upload_on_startup = *flag;
        } else if (arg == "--log_level" || arg == "-l") {
            base.log_level = value;
        } else {
            return Err<Config>(ErrorCode::InvalidConfig, "unknown argument: " + arg);
        }
    }

    return Ok(std::move(base));
}

Result<void> validate(const Config& config) {
    if (config.input_dir.empty()) {
        return Err<void>(ErrorCode::InvalidConfig, "input_dir must be set");
    }
    if (config.store_root.empty()) {
        return Err<void>(ErrorCode::InvalidConfig, "store_root must be set");
    }
    if (config.output_dir.empty()) {
        return Err<void>(ErrorCode::InvalidConfig, "output_dir must be set");
    }
    if (config.poll_interval.count() <= 0) {
        return Err<void>(ErrorCode::InvalidConfig, "poll interval must be positive");
    }
    if (config.stable_samples == 0) {
        return Err<void>(ErrorCode::InvalidConfig, "stable_samples must be positive");
    }
    if (config.open_handle_command.empty()) {
        return Err<void>(ErrorCode::InvalidConfig, "open_handle_command must be set");
    }
    return Ok();
}

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "  -c, --config <file>              JSON configuration file\n"
        << "  -i, --input_dir <dir>            Directory to watch for new files to upload\n"
        << "  -o, --output_dir <name>          Store folder where files should be uploaded\n"
        << "  -s, --store_root <dir>           Root of the mounted remote store\n"
        << "      --upload_on_startup <bool>   Upload files already in --input_dir on startup\n"
        << "  -l, --log_level <level>          trace, debug, info, warn, error\n";
    return oss.str();
}

} // namespace scansync::config
