#pragma once

#include <modelfetch/downloader/downloader.hpp>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace modelfetch::downloader {

/**
 * In-memory progress of one manifest, in manifest order.
 *
 * Every accessor takes the internal mutex, so workers may update their own entry while the
 * engine snapshots the whole list for a checkpoint.
 */
class ManifestState {
public:
    ManifestState(std::string manifestId, const std::vector<FileDescriptor>& files);

    ManifestState(const ManifestState&) = delete;
    ManifestState& operator=(const ManifestState&) = delete;

    /**
     * Copy downloadedBytes/state from a persisted record for every name present in both.
     * Names only in the record are dropped; names only in the manifest stay Pending.
     * Returns the number of entries that matched.
     */
    std::size_t merge(const StatusRecord& prior);

    [[nodiscard]] StatusRecord snapshot() const;
    [[nodiscard]] FileProgress get(std::size_t index) const;

    void setDownloaded(std::size_t index, std::uint64_t bytes);
    void setState(std::size_t index, FileState state);
    void setExpectedSize(std::size_t index, std::uint64_t bytes);

    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] const std::string& manifestId() const noexcept { return manifestId_; }

private:
    const std::string manifestId_;
    const std::size_t size_;
    mutable std::mutex mutex_;
    std::vector<FileProgress> files_;
};

} // namespace modelfetch::downloader
