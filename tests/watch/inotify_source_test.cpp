#include "scansync/watch/inotify_source.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>

#include <sys/inotify.h>
#include <unistd.h>

namespace fs = std::filesystem;
using scansync::ErrorCode;
using scansync::watch::InotifyEventSource;
using scansync::watch::SourceItem;
using scansync::watch::WatchOp;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = fs::temp_directory_path() /
                   ("scansync_inotify_test_" + std::to_string(::getpid()) + "_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

// Skips timeouts and returns the first real item, or a Timeout item after the deadline.
SourceItem next_item(InotifyEventSource& source, std::chrono::seconds limit = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        auto item = source.next_for(std::chrono::milliseconds(50));
        if (item.kind != SourceItem::Kind::Timeout) {
            return item;
        }
    }
    return SourceItem{};
}

} // namespace

TEST(InotifyEventSourceTest, TranslatesMasks) {
    EXPECT_EQ(InotifyEventSource::translate_mask(IN_MODIFY), static_cast<std::uint32_t>(WatchOp::Write));
    EXPECT_EQ(InotifyEventSource::translate_mask(IN_CLOSE_WRITE), static_cast<std::uint32_t>(WatchOp::Write));
    EXPECT_EQ(InotifyEventSource::translate_mask(IN_CREATE), static_cast<std::uint32_t>(WatchOp::Create));
    EXPECT_EQ(InotifyEventSource::translate_mask(IN_MOVED_TO), static_cast<std::uint32_t>(WatchOp::Create));
    EXPECT_EQ(InotifyEventSource::translate_mask(IN_DELETE), static_cast<std::uint32_t>(WatchOp::Remove));
    EXPECT_EQ(InotifyEventSource::translate_mask(IN_MOVED_FROM), static_cast<std::uint32_t>(WatchOp::Rename));
    EXPECT_EQ(InotifyEventSource::translate_mask(IN_ATTRIB), static_cast<std::uint32_t>(WatchOp::Chmod));
    EXPECT_EQ(InotifyEventSource::translate_mask(IN_OPEN), 0u);
}

TEST(InotifyEventSourceTest, ReportsWritesInWatchedDirectory) {
    const auto dir = create_temp_dir();
    auto created = InotifyEventSource::create();
    ASSERT_TRUE(created.is_ok()) << created.error().describe();
    auto& source = *created.value();

    ASSERT_TRUE(source.add(dir).is_ok());

    {
        std::ofstream out(dir / "scan.pdf");
        out << "page";
    }

    bool saw_write = false;
    for (int i = 0; i < 10 && !saw_write; ++i) {
        auto item = next_item(source);
        ASSERT_EQ(item.kind, SourceItem::Kind::Change);
        EXPECT_EQ(item.change.path, dir / "scan.pdf");
        saw_write = item.change.has(WatchOp::Write);
    }
    EXPECT_TRUE(saw_write);

    source.close();
    fs::remove_all(dir);
}

TEST(InotifyEventSourceTest, AddMissingDirectoryFails) {
    auto created = InotifyEventSource::create();
    ASSERT_TRUE(created.is_ok());

    auto result = created.value()->add(fs::temp_directory_path() / "scansync_definitely_missing_dir");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::WatchFailed);
}

TEST(InotifyEventSourceTest, CloseEndsStream) {
    const auto dir = create_temp_dir();
    auto created = InotifyEventSource::create();
    ASSERT_TRUE(created.is_ok());
    auto& source = *created.value();
    ASSERT_TRUE(source.add(dir).is_ok());

    source.close();
    source.close();  // Idempotent

    EXPECT_EQ(source.next_for(std::chrono::milliseconds(10)).kind, SourceItem::Kind::Closed);
    EXPECT_TRUE(source.add(dir).is_error());
    fs::remove_all(dir);
}

TEST(InotifyEventSourceTest, LosingWatchedDirectoryFails) {
    const auto dir = create_temp_dir();
    auto created = InotifyEventSource::create();
    ASSERT_TRUE(created.is_ok());
    auto& source = *created.value();
    ASSERT_TRUE(source.add(dir).is_ok());

    fs::remove_all(dir);

    SourceItem item;
    for (int i = 0; i < 10; ++i) {
        item = next_item(source);
        if (item.kind != SourceItem::Kind::Change) {
            break;
        }
    }
    ASSERT_EQ(item.kind, SourceItem::Kind::Failed);
    EXPECT_NE(item.error_message.find("no longer available"), std::string::npos);
    EXPECT_EQ(source.next_for(std::chrono::milliseconds(10)).kind, SourceItem::Kind::Closed);
}
