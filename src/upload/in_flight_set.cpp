#include "scansync/upload/in_flight_set.hpp"

namespace scansync::upload {

bool InFlightSet::try_claim(const std::string& path) {
    std::lock_guard lock(mutex_);
    bool& claimed = in_flight_[path];
    if (claimed) {
        return false;
    }
    claimed = true;
    return true;
}

void InFlightSet::release(const std::string& path) {
    std::lock_guard lock(mutex_);
    in_flight_.erase(path);  // absent == unclaimed
}

bool InFlightSet::is_claimed(const std::string& path) const {
    std::lock_guard lock(mutex_);
    auto it = in_flight_.find(path);
    return it != in_flight_.end() && it->second;
}

std::size_t InFlightSet::claimed_count() const {
    std::lock_guard lock(mutex_);
    std::size_t count = 0;
    for (const auto& [path, claimed] : in_flight_) {
        if (claimed) {
            ++count;
        }
    }
    return count;
}

} // namespace scansync::upload
