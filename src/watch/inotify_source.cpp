#include "scansync/watch/inotify_source.hpp"

#include <spdlog/spdlog.h>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

namespace scansync::watch {
namespace fs = std::filesystem;

namespace {

constexpr std::uint32_t kWatchMask = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_DELETE |
                                     IN_MOVED_FROM | IN_MOVED_TO | IN_ATTRIB |
                                     IN_DELETE_SELF | IN_MOVE_SELF;

constexpr int kPollTimeoutMs = 200;

constexpr std::size_t kEventBufferLen = 1024 * (sizeof(struct inotify_event) + 256);

std::string errno_message() {
    return std::strerror(errno);
}

} // namespace

Result<std::unique_ptr<InotifyEventSource>> InotifyEventSource::create() {
    const int fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        return Err<std::unique_ptr<InotifyEventSource>>(
            ErrorCode::WatchFailed, "failed to create watcher: " + errno_message());
    }
    return Ok(std::unique_ptr<InotifyEventSource>(new InotifyEventSource(fd)));
}

InotifyEventSource::InotifyEventSource(int inotify_fd) : inotify_fd_(inotify_fd) {}

InotifyEventSource::~InotifyEventSource() {
    close();
}

Result<void> InotifyEventSource::add(const fs::path& directory) {
    if (closed_.load()) {
        return Err<void>(ErrorCode::WatchFailed, "watcher already closed");
    }

    const int wd = inotify_add_watch(inotify_fd_, directory.c_str(), kWatchMask);
    if (wd < 0) {
        if (errno == ENOSPC) {
            return Err<void>(ErrorCode::WatchFailed,
                             "failed to add watcher for " + directory.string() +
                             ": inotify watch limit reached (fs.inotify.max_user_watches)");
        }
        return Err<void>(ErrorCode::WatchFailed,
                         "failed to add watcher for " + directory.string() + ": " + errno_message());
    }

    {
        std::lock_guard lock(mutex_);
        wd_to_path_[wd] = directory;
    }

    if (!running_.exchange(true)) {
        reader_ = std::thread(&InotifyEventSource::read_loop, this);
    }
    spdlog::debug("inotify watching {} (wd={})", directory.string(), wd);
    return Ok();
}

void InotifyEventSource::close() {
    if (closed_.exchange(true)) {
        return;
    }

    running_.store(false);
    if (reader_.joinable()) {
        reader_.join();
    }
    if (inotify_fd_ >= 0) {
        ::close(inotify_fd_);
        inotify_fd_ = -1;
    }
    close_channel();
}

std::uint32_t InotifyEventSource::translate_mask(std::uint32_t mask) {
    std::uint32_t ops = 0;
    if (mask & (IN_CREATE | IN_MOVED_TO)) {
        ops = ops | WatchOp::Create;
    }
    if (mask & (IN_MODIFY | IN_CLOSE_WRITE)) {
        ops = ops | WatchOp::Write;
    }
    if (mask & (IN_DELETE | IN_DELETE_SELF)) {
        ops = ops | WatchOp::Remove;
    }
    if (mask & (IN_MOVED_FROM | IN_MOVE_SELF)) {
        ops = ops | WatchOp::Rename;
    }
    if (mask & IN_ATTRIB) {
        ops = ops | WatchOp::Chmod;
    }
    return ops;
}

void InotifyEventSource::read_loop() {
    alignas(struct inotify_event) char buffer[kEventBufferLen];

    while (running_.load()) {
        struct pollfd pfd;
        pfd.fd = inotify_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        const int poll_result = poll(&pfd, 1, kPollTimeoutMs);
        if (poll_result < 0) {
            if (errno == EINTR) {
                continue;
            }
            fail("poll on inotify descriptor: " + errno_message());
            return;
        }
        if (poll_result == 0) {
            continue;
        }

        const ssize_t len = read(inotify_fd_, buffer, sizeof(buffer));
        if (len < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            fail("read from inotify descriptor: " + errno_message());
            return;
        }

        ssize_t offset = 0;
        while (offset < len) {
            const auto* event = reinterpret_cast<const struct inotify_event*>(buffer + offset);
            handle_event(event->wd, event->mask, event->len > 0 ? event->name : nullptr);
            offset += static_cast<ssize_t>(sizeof(struct inotify_event) + event->len);
        }
    }
}

void InotifyEventSource::handle_event(int wd, std::uint32_t mask, const char* name) {
    if (mask & IN_Q_OVERFLOW) {
        publish(SourceItem::make_error("inotify event queue overflowed; some events were lost"));
        return;
    }

    fs::path directory;
    {
        std::lock_guard lock(mutex_);
        auto it = wd_to_path_.find(wd);
        if (it == wd_to_path_.end()) {
            return;
        }
        directory = it->second;

        if (mask & IN_IGNORED) {
            wd_to_path_.erase(it);
            if (!wd_to_path_.empty()) {
                return;
            }
        }
    }

    if (mask & IN_IGNORED) {
        running_.store(false);
        fail("watched directory " + directory.string() + " is no longer available");
        return;
    }

    const std::uint32_t ops = translate_mask(mask);
    if (ops == 0) {
        return;
    }

    WatchEvent event;
    event.path = name != nullptr ? directory / name : directory;
    event.ops = ops;
    spdlog::trace("inotify {} {}", describe_ops(ops), event.path.string());
    publish(SourceItem::make_change(std::move(event)));
}

} // namespace scansync::watch
