#include "scansync/upload/stability_detector.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using scansync::CancellationSource;
using scansync::CancellationToken;
using scansync::ErrorCode;
using scansync::Result;
using scansync::upload::FileStabilityDetector;
using scansync::upload::StabilityOptions;
using scansync::upload::StabilityTracker;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = fs::temp_directory_path() /
                   ("scansync_stability_test_" + std::to_string(::getpid()) + "_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

// Returns each size in turn, then repeats the last one.
FileStabilityDetector::SizeSampler scripted_sizes(std::vector<std::uint64_t> sizes, int& calls) {
    return [sizes = std::move(sizes), &calls](const fs::path&) -> Result<std::uint64_t> {
        const std::size_t index = std::min<std::size_t>(calls, sizes.size() - 1);
        ++calls;
        return scansync::Ok(sizes[index]);
    };
}

StabilityOptions fast_options(std::uint32_t samples) {
    StabilityOptions options;
    options.poll_interval = std::chrono::milliseconds(1);
    options.required_samples = samples;
    return options;
}

} // namespace

TEST(StabilityTrackerTest, ConstantSizeStableOnEleventhSample) {
    StabilityTracker tracker(10);
    for (int i = 1; i <= 10; ++i) {
        EXPECT_FALSE(tracker.observe(1000)) << "sample " << i;
    }
    EXPECT_TRUE(tracker.observe(1000));
    EXPECT_EQ(tracker.consecutive(), 10u);
}

TEST(StabilityTrackerTest, GrowthResetsCount) {
    StabilityTracker tracker(10);
    for (int i = 0; i < 5; ++i) {
        EXPECT_FALSE(tracker.observe(100));
    }
    EXPECT_EQ(tracker.consecutive(), 4u);

    // The first 200 becomes the new baseline.
    for (int i = 1; i <= 10; ++i) {
        EXPECT_FALSE(tracker.observe(200)) << "sample " << i;
    }
    EXPECT_TRUE(tracker.observe(200));
    EXPECT_EQ(tracker.last_size().value(), 200u);
}

TEST(StabilityTrackerTest, StallThenResumeDoesNotCarryOver) {
    StabilityTracker tracker(3);
    tracker.observe(10);
    tracker.observe(10);
    tracker.observe(10);
    EXPECT_EQ(tracker.consecutive(), 2u);

    EXPECT_FALSE(tracker.observe(20));
    EXPECT_EQ(tracker.consecutive(), 0u);
    EXPECT_FALSE(tracker.observe(20));
    EXPECT_FALSE(tracker.observe(20));
    EXPECT_TRUE(tracker.observe(20));
}

TEST(StabilityTrackerTest, ShrinkAlsoResets) {
    StabilityTracker tracker(2);
    tracker.observe(50);
    tracker.observe(50);
    EXPECT_FALSE(tracker.observe(0));
    EXPECT_EQ(tracker.consecutive(), 0u);
}

TEST(FileStabilityDetectorTest, ConstantSizeTakesElevenSamples) {
    int calls = 0;
    FileStabilityDetector detector(fast_options(10), scripted_sizes({4096}, calls));

    auto result = detector.wait_until_stable("/scans/a.pdf", CancellationToken{});
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(calls, 11);
}

TEST(FileStabilityDetectorTest, GrowingFileTakesSixteenSamples) {
    std::vector<std::uint64_t> sizes(5, 100);
    sizes.insert(sizes.end(), 11, 200);

    int calls = 0;
    FileStabilityDetector detector(fast_options(10), scripted_sizes(sizes, calls));

    auto result = detector.wait_until_stable("/scans/a.pdf", CancellationToken{});
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(calls, 16);
}

TEST(FileStabilityDetectorTest, StatFailureEndsWait) {
    int calls = 0;
    FileStabilityDetector detector(fast_options(10), [&calls](const fs::path& path) -> Result<std::uint64_t> {
        if (++calls == 3) {
            return scansync::Err<std::uint64_t>(ErrorCode::NotFound, "stat " + path.string() + ": gone");
        }
        return scansync::Ok<std::uint64_t>(7);
    });

    auto result = detector.wait_until_stable("/scans/a.pdf", CancellationToken{});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
    EXPECT_EQ(calls, 3);
}

TEST(FileStabilityDetectorTest, CancelDuringWait) {
    StabilityOptions options;
    options.poll_interval = std::chrono::seconds(30);
    options.required_samples = 10;

    int calls = 0;
    FileStabilityDetector detector(options, scripted_sizes({1}, calls));

    CancellationSource source;
    std::thread canceller([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        source.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    auto result = detector.wait_until_stable("/scans/a.pdf", source.token());
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is_cancelled());
    EXPECT_EQ(calls, 1);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(FileStabilityDetectorTest, StatFileSizeReadsRealFiles) {
    const auto dir = create_temp_dir();
    const auto file = dir / "scan.pdf";
    {
        std::ofstream out(file, std::ios::binary);
        out << "0123456789";
    }

    auto size = FileStabilityDetector::stat_file_size(file);
    ASSERT_TRUE(size.is_ok());
    EXPECT_EQ(size.value(), 10u);

    auto missing = FileStabilityDetector::stat_file_size(dir / "missing.pdf");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    fs::remove_all(dir);
}

TEST(FileStabilityDetectorTest, DefaultSamplerSettlesOnRealFile) {
    const auto dir = create_temp_dir();
    const auto file = dir / "scan.pdf";
    {
        std::ofstream out(file, std::ios::binary);
        out << "scan";
    }

    FileStabilityDetector detector(fast_options(2));
    EXPECT_TRUE(detector.wait_until_stable(file, CancellationToken{}).is_ok());

    fs::remove_all(dir);
}
