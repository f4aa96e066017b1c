#include "scansync/watch/event_source.hpp"

#include <utility>

namespace scansync::watch {

std::string describe_ops(std::uint32_t ops) {
    static const std::pair<WatchOp, const char*> kNames[] = {
        {WatchOp::Create, "CREATE"},
        {WatchOp::Write, "WRITE"},
        {WatchOp::Remove, "REMOVE"},
        {WatchOp::Rename, "RENAME"},
        {WatchOp::Chmod, "CHMOD"},
    };

    std::string out;
    for (const auto& [op, name] : kNames) {
        if ((ops & static_cast<std::uint32_t>(op)) == 0) {
            continue;
        }
        if (!out.empty()) {
            out += "|";
        }
        out += name;
    }
    return out.empty() ? std::string("NONE") : out;
}

SourceItem QueuedEventSource::next_for(std::chrono::milliseconds timeout) {
    if (auto item = channel_.pop_for(timeout)) {
        return std::move(*item);
    }

    SourceItem idle;
    idle.kind = channel_.drained() ? SourceItem::Kind::Closed : SourceItem::Kind::Timeout;
    return idle;
}

} // namespace scansync::watch
