#include "scansync/upload/ignore_filter.hpp"

namespace scansync::upload {

IgnoreFilter::IgnoreFilter() : ignored_names_{".DS_Store"} {}

IgnoreFilter::IgnoreFilter(const std::vector<std::string>& ignored_names)
    : ignored_names_(ignored_names.begin(), ignored_names.end()) {}

bool IgnoreFilter::should_ignore(const std::filesystem::path& path) const {
    const std::string base = path.filename().string();
    if (ignored_names_.count(base) > 0) {
        return true;
    }
    return !base.empty() && base.front() == '.';
}

} // namespace scansync::upload
