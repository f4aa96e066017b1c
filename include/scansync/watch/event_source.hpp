/**
 * @file event_source.hpp
 * @brief Directory change notifications consumed by the watch loop
 *
 * WHY THIS FILE EXISTS:
 * Separates "where events come from" (inotify in production, a scripted
 * queue in tests) from the dispatcher that acts on them.
 *
 * A source yields, one at a time:
 * - Change:  a path and the operations observed on it
 * - Error:   a non-fatal source problem (logged, loop continues)
 * - Failed:  a terminal source problem (loop returns the error)
 * - Closed:  the stream is exhausted (loop returns cleanly)
 * - Timeout: nothing arrived within the wait slice
 */

#pragma once

#include "scansync/core/result.hpp"
#include "scansync/events/event_channel.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace scansync::watch {

enum class WatchOp : std::uint32_t {
    Create = 1u << 0,
    Write  = 1u << 1,
    Remove = 1u << 2,
    Rename = 1u << 3,
    Chmod  = 1u << 4
};

inline std::uint32_t operator|(WatchOp lhs, WatchOp rhs) {
    return static_cast<std::uint32_t>(lhs) | static_cast<std::uint32_t>(rhs);
}

inline std::uint32_t operator|(std::uint32_t lhs, WatchOp rhs) {
    return lhs | static_cast<std::uint32_t>(rhs);
}

std::string describe_ops(std::uint32_t ops);

struct WatchEvent {
    std::filesystem::path path;
    std::uint32_t ops = 0; ///< Bitmask of WatchOp

    [[nodiscard]] bool has(WatchOp op) const noexcept {
        return (ops & static_cast<std::uint32_t>(op)) != 0;
    }
};

struct SourceItem {
    enum class Kind {
        Change,
        Error,
        Failed,
        Closed,
        Timeout
    };

    Kind kind = Kind::Timeout;
    WatchEvent change;
    std::string error_message;

    static SourceItem make_change(WatchEvent event) {
        SourceItem item;
        item.kind = Kind::Change;
        item.change = std::move(event);
        return item;
    }

    static SourceItem make_error(std::string message) {
        SourceItem item;
        item.kind = Kind::Error;
        item.error_message = std::move(message);
        return item;
    }

    static SourceItem make_failed(std::string message) {
        SourceItem item;
        item.kind = Kind::Failed;
        item.error_message = std::move(message);
        return item;
    }
};

/**
 * @brief Stream of change events for one watched directory
 */
class DirectoryEventSource {
public:
    virtual ~DirectoryEventSource() = default;

    /**
     * @brief Start watching directory (non-recursive)
     */
    virtual Result<void> add(const std::filesystem::path& directory) = 0;

    /**
     * @brief Wait up to timeout for the next item
     */
    virtual SourceItem next_for(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Tear down the watch. Safe to call any number of times.
     */
    virtual void close() = 0;
};

/**
 * @brief Source whose producer side pushes into an EventChannel
 *
 * Closing the channel ends the stream: consumers drain what was already
 * queued and then see Closed. A producer reports a terminal failure with
 * fail(), which queues a Failed item and closes the channel.
 */
class QueuedEventSource : public DirectoryEventSource {
public:
    SourceItem next_for(std::chrono::milliseconds timeout) override;

protected:
    bool publish(SourceItem item) { return channel_.push(std::move(item)); }

    void fail(std::string message) {
        channel_.push(SourceItem::make_failed(std::move(message)));
        channel_.close();
    }

    void close_channel() { channel_.close(); }

private:
    events::EventChannel<SourceItem> channel_;
};

} // namespace scansync::watch
