#pragma once

#include "scansync/core/result.hpp"
#include "scansync/watch/event_source.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace scansync::watch {

/**
 * @brief Linux inotify event source
 *
 * A reader thread polls the inotify descriptor and publishes translated
 * events. IN_MODIFY and IN_CLOSE_WRITE both map to WatchOp::Write. Losing
 * the watched directory, or an unrecoverable read error, fails the source.
 */
class InotifyEventSource : public QueuedEventSource {
public:
    static Result<std::unique_ptr<InotifyEventSource>> create();

    ~InotifyEventSource() override;

    InotifyEventSource(const InotifyEventSource&) = delete;
    InotifyEventSource& operator=(const InotifyEventSource&) = delete;

    Result<void> add(const std::filesystem::path& directory) override;

    void close() override;

    static std::uint32_t translate_mask(std::uint32_t mask);

private:
    explicit InotifyEventSource(int inotify_fd);

    void read_loop();
    void handle_event(int wd, std::uint32_t mask, const char* name);

    int inotify_fd_;
    std::mutex mutex_;
    std::unordered_map<int, std::filesystem::path> wd_to_path_;
    std::thread reader_;
    std::atomic<bool> running_{false};
    std::atomic<bool> closed_{false};
};

} // namespace scansync::watch
