#pragma once

#include "scansync/remote/remote_store.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>

namespace scansync::remote {

/**
 * @brief RemoteStore over a mounted remote tree (NAS share, FUSE drive)
 *
 * Folders are existing directories directly under the store root. Uploads
 * stream in chunks into a hidden staging file inside the destination
 * folder and are renamed into place once complete, so a half-written
 * upload is never visible under its final name.
 */
class DirectoryStore : public RemoteStore {
public:
    static constexpr std::size_t kDefaultChunkSize = 256 * 1024;

    explicit DirectoryStore(std::filesystem::path root, std::size_t chunk_size = kDefaultChunkSize);

    Result<FolderRef> resolve_folder(const std::string& name) override;

    Result<void> upload(const UploadSource& source,
                        const FolderRef& folder,
                        const ProgressCallback& progress,
                        const CancellationToken& token) override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path make_staging_path(const std::filesystem::path& folder,
                                            const std::string& name);

    std::filesystem::path root_;
    std::size_t chunk_size_;
    std::atomic<uint64_t> staging_counter_{0};
};

} // namespace scansync::remote
