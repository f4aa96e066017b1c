#include "scansync/watch/watch_loop.hpp"

#include "scansync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace scansync::watch {
namespace fs = std::filesystem;

WatchLoop::WatchLoop(fs::path directory,
                     DirectoryEventSource& source,
                     upload::UploadCoordinator& coordinator,
                     const upload::IgnoreFilter& filter,
                     events::EventBus& bus,
                     WatchOptions options)
    : directory_(std::move(directory)),
      source_(source),
      coordinator_(coordinator),
      filter_(filter),
      bus_(bus),
      options_(options) {}

Result<void> WatchLoop::run(const CancellationToken& token) {
    if (options_.initial_sweep) {
        if (auto swept = sweep(token); swept.is_error()) {
            bus_.emit(events::WatchStoppedEvent{directory_.string(), swept.error().message});
            return swept;
        }
    }

    bus_.emit(events::WatchStartedEvent{directory_.string()});

    auto stop = [this](Result<void> result, const std::string& reason) {
        bus_.emit(events::WatchStoppedEvent{directory_.string(), reason});
        return result;
    };

    bool announce = true;
    auto last_item = std::chrono::steady_clock::now();

    while (true) {
        if (announce) {
            spdlog::info("Waiting for new files in {}...", directory_.string());
            announce = false;
        }

        if (token.is_cancelled()) {
            return stop(Err<void>(Error::cancelled()), "cancelled");
        }

        SourceItem item = source_.next_for(options_.wait_slice);
        if (item.kind != SourceItem::Kind::Timeout) {
            // Re-announce only after a burst that followed a quiet period.
            const auto now = std::chrono::steady_clock::now();
            announce = now - last_item > options_.idle_log_interval;
            last_item = now;
        }

        switch (item.kind) {
            case SourceItem::Kind::Timeout:
                break;

            case SourceItem::Kind::Change:
                dispatch(item.change, token);
                break;

            case SourceItem::Kind::Error:
                spdlog::error("watch error: {}", item.error_message);
                break;

            case SourceItem::Kind::Failed:
                return stop(Err<void>(ErrorCode::WatchFailed, item.error_message), item.error_message);

            case SourceItem::Kind::Closed:
                return stop(Ok(), "event source closed");
        }
    }
}

Result<void> WatchLoop::sweep(const CancellationToken& token) {
    spdlog::info("Looking for files already in {}...", directory_.string());

    std::error_code ec;
    fs::directory_iterator it(directory_, ec);
    if (ec) {
        return Err<void>(ErrorCode::Io, "failed to list directory contents: " + ec.message());
    }

    fs::directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (token.is_cancelled()) {
            return Err<void>(Error::cancelled());
        }

        const fs::path path = it->path();
        if (filter_.should_ignore(path)) {
            spdlog::debug("Ignoring {}", path.string());
            continue;
        }

        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            spdlog::debug("Skipping non-regular entry {}", path.string());
            continue;
        }

        bus_.emit(events::FileDiscoveredEvent{path.string(), "sweep"});
        coordinator_.schedule(path, token);
    }

    if (ec) {
        return Err<void>(ErrorCode::Io, "failed to list directory contents: " + ec.message());
    }
    return Ok();
}

void WatchLoop::dispatch(const WatchEvent& event, const CancellationToken& token) {
    if (coordinator_.is_in_flight(event.path)) {
        spdlog::trace("{} already in flight; dropping {}", event.path.string(), describe_ops(event.ops));
        return;
    }
    if (!event.has(WatchOp::Write)) {
        return;
    }
    if (filter_.should_ignore(event.path)) {
        return;
    }

    std::error_code ec;
    if (!fs::exists(event.path, ec)) {
        // Removed between the event firing and being handled.
        spdlog::debug("{} no longer exists; skipping", event.path.string());
        return;
    }

    bus_.emit(events::FileDiscoveredEvent{event.path.string(), "watch"});
    coordinator_.schedule(event.path, token);
}

} // namespace scansync::watch
