#pragma once

#include <modelfetch/downloader/downloader.hpp>
#include <modelfetch/downloader/manifest_state.hpp>

#include <spdlog/logger.h>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

namespace modelfetch::downloader {

/**
 * Result of one transfer attempt for one file.
 */
struct TransferOutcome {
    FileState state{FileState::Pending};
    std::optional<Error> error{};
    bool retryable{false};
};

/**
 * Full-record checkpoint requested by a worker; provided by the engine.
 */
using CheckpointFn = std::function<void()>;

/**
 * Relative, non-empty, and free of ".." components.
 */
[[nodiscard]] bool isSafeRelativeName(std::string_view name);

/**
 * Downloads a single file of a manifest into `destDir`.
 *
 * - Bytes go to "<destDir>/<name><tempSuffix>"; its size on disk is the resume offset.
 * - The final name only appears after the content has been verified and renamed into place.
 * - Progress for the file is published into the shared ManifestState at `index`.
 * - One call is one attempt; retrying is the caller's decision (see TransferOutcome::retryable).
 */
class FileTransferWorker {
public:
    FileTransferWorker(const DownloaderConfig& cfg, IHttpAdapter& http,
                       std::shared_ptr<spdlog::logger> logger, Clock clock = {});

    TransferOutcome transfer(const FileDescriptor& file, const std::filesystem::path& destDir,
                             ManifestState& state, std::size_t index,
                             const CheckpointFn& checkpoint, const ShouldCancel& shouldCancel);

private:
    [[nodiscard]] std::chrono::steady_clock::time_point now() const;

    const DownloaderConfig& cfg_;
    IHttpAdapter& http_;
    std::shared_ptr<spdlog::logger> logger_;
    Clock clock_;
};

} // namespace modelfetch::downloader
