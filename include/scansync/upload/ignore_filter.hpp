#pragma once

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

namespace scansync::upload {

/**
 * @brief Decides which paths are never uploaded
 *
 * A path is ignored when its basename begins with '.' (hidden files,
 * editor and transfer temporaries) or exactly matches one of the
 * configured names (platform metadata such as .DS_Store).
 */
class IgnoreFilter {
public:
    IgnoreFilter();
    explicit IgnoreFilter(const std::vector<std::string>& ignored_names);

    [[nodiscard]] bool should_ignore(const std::filesystem::path& path) const;

    [[nodiscard]] const std::unordered_set<std::string>& ignored_names() const noexcept {
        return ignored_names_;
    }

private:
    std::unordered_set<std::string> ignored_names_;
};

} // namespace scansync::upload
