#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace scansync::upload {

/**
 * @brief Paths currently owned by an upload task
 *
 * try_claim() is the only unclaimed -> claimed transition and is atomic
 * under the lock. The lock is never held across I/O.
 */
class InFlightSet {
public:
    /**
     * @brief Mark path as in flight
     *
     * RETURNS: false if another task already holds it
     */
    bool try_claim(const std::string& path);

    void release(const std::string& path);

    [[nodiscard]] bool is_claimed(const std::string& path) const;

    /**
     * @brief Number of paths currently claimed
     */
    [[nodiscard]] std::size_t claimed_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, bool> in_flight_;
};

/**
 * @brief RAII claim: releases the path on every exit from a task
 */
class PathClaim {
public:
    PathClaim(InFlightSet& set, std::string path)
        : set_(&set), path_(std::move(path)), held_(set.try_claim(path_)) {}

    ~PathClaim() {
        if (held_) {
            set_->release(path_);
        }
    }

    PathClaim(const PathClaim&) = delete;
    PathClaim& operator=(const PathClaim&) = delete;

    [[nodiscard]] bool held() const noexcept { return held_; }

private:
    InFlightSet* set_;
    std::string path_;
    bool held_;
};

} // namespace scansync::upload
