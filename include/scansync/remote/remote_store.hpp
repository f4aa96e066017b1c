#pragma once

#include "scansync/core/cancellation.hpp"
#include "scansync/core/result.hpp"

#include <cstdint>
#include <functional>
#include <istream>
#include <string>

namespace scansync::remote {

/**
 * @brief Resolved destination folder, immutable for the process lifetime
 */
struct FolderRef {
    std::string id;   ///< Store-specific opaque identifier
    std::string name; ///< Human-readable name it was resolved from
};

/**
 * @brief Open local file handed to the store
 */
struct UploadSource {
    std::string name;       ///< Destination file name (local basename)
    std::istream& stream;
    std::uint64_t size = 0;
};

using ProgressCallback = std::function<void(std::uint64_t bytes_sent, std::uint64_t total_bytes)>;

/**
 * @brief Remote storage collaborator
 *
 * Errors are opaque to the upload engine: every failed upload is terminal
 * for that attempt. Implementations must be safe to call from several
 * upload threads at once.
 */
class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    virtual Result<FolderRef> resolve_folder(const std::string& name) = 0;

    virtual Result<void> upload(const UploadSource& source,
                                const FolderRef& folder,
                                const ProgressCallback& progress,
                                const CancellationToken& token) = 0;
};

} // namespace scansync::remote
