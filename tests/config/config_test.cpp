#include "scansync/config/config.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>

#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;
using scansync::ErrorCode;
using scansync::config::Config;

namespace {

fs::path write_config(const std::string& content) {
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path path = fs::temp_directory_path() /
                    ("scansync_config_test_" + std::to_string(::getpid()) + "_" + std::to_string(id) + ".json");
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST(ConfigTest, Defaults) {
    Config config;
    EXPECT_EQ(config.input_dir, fs::path("/share/Scans"));
    EXPECT_EQ(config.output_dir, "Incoming Scans");
    EXPECT_TRUE(config.upload_on_startup);
    EXPECT_EQ(config.poll_interval, std::chrono::milliseconds(1000));
    EXPECT_EQ(config.stable_samples, 10u);
    EXPECT_EQ(config.ignore_names, std::vector<std::string>{".DS_Store"});
    EXPECT_EQ(config.open_handle_command, "lsof");
}

TEST(ConfigTest, FromJsonOverridesFields) {
    const json document = {
        {"input_dir", "/srv/scans"},
        {"output_dir", "Archive"},
        {"store_root", "/mnt/drive"},
        {"upload_on_startup", false},
        {"poll_interval_ms", 250},
        {"stable_samples", 4},
        {"ignore_names", json::array({"Thumbs.db"})},
        {"log_level", "debug"},
    };

    auto config = scansync::config::from_json(document);
    ASSERT_TRUE(config.is_ok()) << config.error().describe();
    EXPECT_EQ(config.value().input_dir, fs::path("/srv/scans"));
    EXPECT_EQ(config.value().output_dir, "Archive");
    EXPECT_EQ(config.value().store_root, fs::path("/mnt/drive"));
    EXPECT_FALSE(config.value().upload_on_startup);
    EXPECT_EQ(config.value().poll_interval, std::chrono::milliseconds(250));
    EXPECT_EQ(config.value().stable_samples, 4u);
    EXPECT_EQ(config.value().ignore_names, std::vector<std::string>{"Thumbs.db"});
    EXPECT_EQ(config.value().log_level, "debug");
    EXPECT_EQ(config.value().open_handle_command, "lsof");
}

TEST(ConfigTest, FromJsonRejectsBadValues) {
    EXPECT_EQ(scansync::config::from_json(json::array()).error().code, ErrorCode::InvalidConfig);
    EXPECT_EQ(scansync::config::from_json(json{{"poll_interval_ms", 0}}).error().code, ErrorCode::InvalidConfig);
    EXPECT_EQ(scansync::config::from_json(json{{"stable_samples", -1}}).error().code, ErrorCode::InvalidConfig);
    EXPECT_EQ(scansync::config::from_json(json{{"upload_on_startup", "maybe"}}).error().code,
              ErrorCode::InvalidConfig);
}

TEST(ConfigTest, FromJsonRejectsSampleCountBeyondUint32) {
    auto config = scansync::config::from_json(json{{"stable_samples", 4294967297LL}});
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
    EXPECT_EQ(config.error().message, "stable_samples is too large");

    auto largest = scansync::config::from_json(json{{"stable_samples", 4294967295LL}});
    ASSERT_TRUE(largest.is_ok()) << largest.error().describe();
    EXPECT_EQ(largest.value().stable_samples, 4294967295u);
}

TEST(ConfigTest, LoadFile) {
    const auto path = write_config(R"({"input_dir": "/srv/scans", "output_dir": "Archive"})");

    auto config = scansync::config::load_file(path);
    ASSERT_TRUE(config.is_ok()) << config.error().describe();
    EXPECT_EQ(config.value().input_dir, fs::path("/srv/scans"));
    EXPECT_EQ(config.value().output_dir, "Archive");

    fs::remove(path);
}

TEST(ConfigTest, LoadFileErrors) {
    EXPECT_EQ(scansync::config::load_file("/nonexistent/scansync.json").error().code, ErrorCode::InvalidConfig);

    const auto path = write_config("{ not json");
    EXPECT_EQ(scansync::config::load_file(path).error().code, ErrorCode::InvalidConfig);
    fs::remove(path);
}

TEST(ConfigTest, ParseArgs) {
    const char* argv[] = {"scansync", "--input_dir", "/srv/scans", "-o", "Archive",
                          "--store_root", "/mnt/drive", "--upload_on_startup", "false"};
    auto config = scansync::config::parse_args(9, argv);

    ASSERT_TRUE(config.is_ok()) << config.error().describe();
    EXPECT_EQ(config.value().input_dir, fs::path("/srv/scans"));
    EXPECT_EQ(config.value().output_dir, "Archive");
    EXPECT_EQ(config.value().store_root, fs::path("/mnt/drive"));
    EXPECT_FALSE(config.value().upload_on_startup);
}

TEST(ConfigTest, FlagsOverrideConfigFileInAnyOrder) {
    const auto path = write_config(R"({"input_dir": "/from/file", "output_dir": "FileFolder"})");
    const std::string path_arg = path.string();

    const char* argv[] = {"scansync", "-i", "/from/flag", "--config", path_arg.c_str()};
    auto config = scansync::config::parse_args(5, argv);

    ASSERT_TRUE(config.is_ok()) << config.error().describe();
    EXPECT_EQ(config.value().input_dir, fs::path("/from/flag"));
    EXPECT_EQ(config.value().output_dir, "FileFolder");

    fs::remove(path);
}

TEST(ConfigTest, ParseArgsErrors) {
    const char* unknown[] = {"scansync", "--bogus", "1"};
    EXPECT_TRUE(scansync::config::parse_args(3, unknown).is_error());

    const char* incomplete[] = {"scansync", "--input_dir"};
    EXPECT_TRUE(scansync::config::parse_args(2, incomplete).is_error());

    const char* bad_bool[] = {"scansync", "--upload_on_startup", "sometimes"};
    EXPECT_TRUE(scansync::config::parse_args(3, bad_bool).is_error());
}

TEST(ConfigTest, Validate) {
    Config config;
    EXPECT_TRUE(scansync::config::validate(config).is_error());  // store_root unset

    config.store_root = "/mnt/drive";
    EXPECT_TRUE(scansync::config::validate(config).is_ok());

    config.output_dir.clear();
    EXPECT_TRUE(scansync::config::validate(config).is_error());
}

TEST(ConfigTest, UsageListsFlags) {
    const auto text = scansync::config::usage("scansync");
    EXPECT_NE(text.find("--input_dir"), std::string::npos);
    EXPECT_NE(text.find("--output_dir"), std::string::npos);
    EXPECT_NE(text.find("--upload_on_startup"), std::string::npos);
}
