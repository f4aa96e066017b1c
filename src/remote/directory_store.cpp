#include "scansync/remote/directory_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <system_error>
#include <vector>

namespace scansync::remote {
namespace fs = std::filesystem;

namespace {

void discard_staging(const fs::path& staging_path) {
    std::error_code ec;
    fs::remove(staging_path, ec);
    if (ec) {
        spdlog::warn("failed to remove staging file {}: {}", staging_path.string(), ec.message());
    }
}

} // namespace

DirectoryStore::DirectoryStore(fs::path root, std::size_t chunk_size)
    : root_(std::move(root)), chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size) {}

Result<FolderRef> DirectoryStore::resolve_folder(const std::string& name) {
    if (name.empty()) {
        return Err<FolderRef>(ErrorCode::InvalidConfig, "destination folder name is empty");
    }
    if (fs::path(name).has_parent_path() || name == "." || name == "..") {
        return Err<FolderRef>(ErrorCode::InvalidConfig, "destination folder must be a single name: " + name);
    }

    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return Err<FolderRef>(ErrorCode::NotFound, "unable to retrieve store root: " + root_.string());
    }

    const fs::path folder = root_ / name;
    if (!fs::is_directory(folder, ec)) {
        return Err<FolderRef>(ErrorCode::NotFound, "unable to find folder: " + name);
    }

    const fs::path canonical = fs::canonical(folder, ec);
    if (ec) {
        return Err<FolderRef>(ErrorCode::Io, "unable to resolve folder " + name + ": " + ec.message());
    }
    return Ok(FolderRef{canonical.string(), name});
}

Result<void> DirectoryStore::upload(const UploadSource& source,
                                    const FolderRef& folder,
                                    const ProgressCallback& progress,
                                    const CancellationToken& token) {
    if (source.name.empty()) {
        return Err<void>(ErrorCode::UploadFailed, "upload source has no name");
    }

    const fs::path folder_path(folder.id);
    const fs::path staging_path = make_staging_path(folder_path, source.name);
    const fs::path destination_path = folder_path / source.name;

    std::ofstream output(staging_path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<void>(ErrorCode::UploadFailed, "failed to create staging file: " + staging_path.string());
    }

    std::vector<char> buffer(chunk_size_);
    std::uint64_t sent = 0;

    while (sent < source.size) {
        if (token.is_cancelled()) {
            output.close();
            discard_staging(staging_path);
            return Err<void>(Error::cancelled());
        }

        const auto wanted = std::min<std::uint64_t>(buffer.size(), source.size - sent);
        source.stream.read(buffer.data(), static_cast<std::streamsize>(wanted));
        const auto bytes_read = static_cast<std::size_t>(source.stream.gcount());
        if (bytes_read == 0) {
            break;
        }

        output.write(buffer.data(), static_cast<std::streamsize>(bytes_read));
        if (!output) {
            output.close();
            discard_staging(staging_path);
            return Err<void>(ErrorCode::UploadFailed, "failed writing " + staging_path.string());
        }

        sent += bytes_read;
        if (progress) {
            progress(sent, source.size);
        }
    }

    output.close();
    if (!output) {
        discard_staging(staging_path);
        return Err<void>(ErrorCode::UploadFailed, "failed to flush " + staging_path.string());
    }

    if (sent != source.size) {
        discard_staging(staging_path);
        return Err<void>(ErrorCode::UploadFailed,
                         "short read of " + source.name + ": " + std::to_string(sent) + " of " +
                         std::to_string(source.size) + " bytes");
    }

    std::error_code ec;
    fs::rename(staging_path, destination_path, ec);
    if (ec) {
        discard_staging(staging_path);
        return Err<void>(ErrorCode::UploadFailed,
                         "failed to move upload into place: " + destination_path.string() + ": " + ec.message());
    }

    return Ok();
}

fs::path DirectoryStore::make_staging_path(const fs::path& folder, const std::string& name) {
    return folder / ("." + name + ".partial-" + std::to_string(++staging_counter_));
}

} // namespace scansync::remote
