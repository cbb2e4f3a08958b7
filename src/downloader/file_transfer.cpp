/*
 * modelfetch/src/downloader/file_transfer.cpp
 *
 * FileTransferWorker:
 * - Resume offset is the size of "<name>.tmp" on disk, never a number from the status record
 * - Bytes are buffered up to chunkSizeBytes and appended with write(2); the fd is O_APPEND so a
 *   response that ignores the requested offset can simply ftruncate(0) and continue
 * - Checkpoints are rate limited by time and by bytes
 * - Verification happens on the temp file; only verified content is renamed to the final name
 */

#include <modelfetch/downloader/atomic_file.hpp>
#include <modelfetch/downloader/file_transfer.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace modelfetch::downloader {

namespace fs = std::filesystem;

namespace {

std::string errnoMessage(int err) {
    return std::system_category().message(err);
}

// Owns a POSIX file descriptor.
class FdGuard {
public:
    explicit FdGuard(int fd) noexcept : fd_(fd) {}
    ~FdGuard() { close(); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    void close() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

TransferOutcome failed(Error err, bool retryable) {
    return TransferOutcome{FileState::Failed, std::move(err), retryable};
}

} // namespace

bool isSafeRelativeName(std::string_view name) {
    if (name.empty())
        return false;
    const fs::path p{std::string(name)};
    if (p.is_absolute() || p.has_root_path())
        return false;
    for (const auto& part : p) {
        if (part == "..")
            return false;
    }
    return true;
}

FileTransferWorker::FileTransferWorker(const DownloaderConfig& cfg, IHttpAdapter& http,
                                       std::shared_ptr<spdlog::logger> logger, Clock clock)
    : cfg_(cfg), http_(http), logger_(std::move(logger)), clock_(std::move(clock)) {
    if (!logger_)
        logger_ = spdlog::default_logger();
}

std::chrono::steady_clock::time_point FileTransferWorker::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

TransferOutcome FileTransferWorker::transfer(const FileDescriptor& file, const fs::path& destDir,
                                             ManifestState& state, std::size_t index,
                                             const CheckpointFn& checkpoint,
                                             const ShouldCancel& shouldCancel) {
    auto requestCheckpoint = [&] {
        if (checkpoint)
            checkpoint();
    };
    auto cancelled = [&] { return shouldCancel && shouldCancel(); };

    if (!isSafeRelativeName(file.name)) {
        logger_->error("Refusing to write '{}': not a safe relative path", file.name);
        state.setState(index, FileState::Failed);
        requestCheckpoint();
        return failed(Error{ErrorCode::InvalidArgument, "unsafe file name: " + file.name}, false);
    }

    const fs::path localPath = (destDir / fs::path(file.name)).lexically_normal();
    fs::path tempPath = localPath;
    tempPath += cfg_.tempSuffix;
    const bool mustVerify = cfg_.verifyChecksums && !file.expectedHash.empty();

    std::error_code ec;

    // Already present and good: nothing to transfer.
    if (fs::is_regular_file(localPath, ec)) {
        if (!mustVerify || verifyFile(localPath, file.expectedHash)) {
            const auto size = fs::file_size(localPath, ec);
            state.setDownloaded(index, ec ? 0 : size);
            state.setState(index, FileState::Completed);
            fs::remove(tempPath, ec);
            logger_->info("{}: already present, skipping", file.name);
            requestCheckpoint();
            return TransferOutcome{FileState::Completed, std::nullopt, false};
        }
        logger_->warn("{}: existing file failed verification, downloading again", file.name);
        fs::remove(localPath, ec);
        if (ec) {
            state.setState(index, FileState::Failed);
            requestCheckpoint();
            return failed(Error{ErrorCode::IoError, "cannot remove unverified " +
                                                        localPath.string() + ": " + ec.message()},
                          true);
        }
    }

    if (cancelled()) {
        state.setState(index, FileState::Stopped);
        return TransferOutcome{FileState::Stopped, Error{ErrorCode::Cancelled, "stopped"}, false};
    }

    fs::create_directories(localPath.parent_path(), ec);
    if (ec) {
        state.setState(index, FileState::Failed);
        requestCheckpoint();
        return failed(Error{ErrorCode::IoError, "create_directories failed for " +
                                                    localPath.parent_path().string() + ": " +
                                                    ec.message()},
                      true);
    }

    std::uint64_t offset = 0;
    if (fs::is_regular_file(tempPath, ec)) {
        const auto sz = fs::file_size(tempPath, ec);
        if (!ec)
            offset = sz;
    }

    FdGuard fd(::open(tempPath.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
    if (!fd.valid()) {
        const int err = errno;
        state.setState(index, FileState::Failed);
        requestCheckpoint();
        return failed(Error{ErrorCode::IoError,
                            "open failed for " + tempPath.string() + ": " + errnoMessage(err)},
                      true);
    }

    state.setDownloaded(index, offset);
    state.setState(index, FileState::Downloading);
    if (offset > 0) {
        logger_->info("{}: resuming at byte {}", file.name, offset);
    } else {
        logger_->debug("{}: starting download from {}", file.name, file.sourceUrl);
    }

    std::vector<std::byte> buffer;
    buffer.reserve(cfg_.chunkSizeBytes);
    std::uint64_t bytesSinceCheckpoint = 0;
    auto lastCheckpoint = now();

    auto maybeCheckpoint = [&] {
        if (bytesSinceCheckpoint >= cfg_.checkpointBytes ||
            now() - lastCheckpoint >= cfg_.checkpointInterval) {
            requestCheckpoint();
            bytesSinceCheckpoint = 0;
            lastCheckpoint = now();
        }
    };

    // Append the buffered bytes; whatever reached the disk stays a valid prefix.
    auto flush = [&]() -> Expected<void> {
        std::size_t done = 0;
        while (done < buffer.size()) {
            const ssize_t n = ::write(fd.get(), buffer.data() + done, buffer.size() - done);
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                const int err = errno;
                buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(done));
                return Error{ErrorCode::IoError,
                             "write failed for " + tempPath.string() + ": " + errnoMessage(err)};
            }
            done += static_cast<std::size_t>(n);
        }
        bytesSinceCheckpoint += buffer.size();
        buffer.clear();

        struct stat st{};
        if (::fstat(fd.get(), &st) == 0) {
            state.setDownloaded(index, static_cast<std::uint64_t>(st.st_size));
        }
        maybeCheckpoint();
        return Expected<void>{};
    };

    const std::uint64_t requestedOffset = offset;
    auto onResponse = [&](const ResponseInfo& info) -> Expected<void> {
        if (requestedOffset > 0 && info.startOffset != requestedOffset) {
            logger_->warn("{}: source ignored resume offset {} (status {}), restarting from 0",
                          file.name, requestedOffset, info.httpStatus);
            if (::ftruncate(fd.get(), 0) != 0) {
                const int err = errno;
                return Error{ErrorCode::IoError, "ftruncate failed for " + tempPath.string() +
                                                     ": " + errnoMessage(err)};
            }
            offset = 0;
            state.setDownloaded(index, 0);
        }
        if (info.contentLength) {
            state.setExpectedSize(index, offset + *info.contentLength);
        }
        return Expected<void>{};
    };

    auto sink = [&](std::span<const std::byte> data) -> Expected<void> {
        buffer.insert(buffer.end(), data.begin(), data.end());
        if (buffer.size() >= cfg_.chunkSizeBytes) {
            return flush();
        }
        return Expected<void>{};
    };

    auto res = http_.fetch(file.sourceUrl, {}, requestedOffset, onResponse, sink, shouldCancel);

    // Bytes received before a failure or stop are valid and kept for the next resume.
    auto flushed = flush();

    if (!res.ok()) {
        const auto& err = res.error();
        const bool rangeDone = err.code == ErrorCode::RangeNotSatisfiable && requestedOffset > 0;
        if (!rangeDone) {
            if (err.code == ErrorCode::Cancelled || cancelled()) {
                state.setState(index, FileState::Stopped);
                logger_->info("{}: stopped at byte {}", file.name,
                              state.get(index).downloadedBytes);
                requestCheckpoint();
                return TransferOutcome{FileState::Stopped, err, false};
            }
            state.setState(index, FileState::Failed);
            requestCheckpoint();
            const bool retryable = isTransient(err.code);
            logger_->warn("{}: {} ({}{})", file.name, err.message, toString(err.code),
                          retryable ? ", partial data kept" : "");
            return failed(err, retryable);
        }
        logger_->debug("{}: range not satisfiable at {}, treating partial file as complete",
                       file.name, requestedOffset);
    }

    if (!flushed.ok()) {
        state.setState(index, FileState::Failed);
        requestCheckpoint();
        return failed(flushed.error(), true);
    }

    if (::fsync(fd.get()) != 0) {
        const int err = errno;
        state.setState(index, FileState::Failed);
        requestCheckpoint();
        return failed(Error{ErrorCode::IoError,
                            "fsync failed for " + tempPath.string() + ": " + errnoMessage(err)},
                      true);
    }
    fd.close();

    if (mustVerify && !verifyFile(tempPath, file.expectedHash)) {
        logger_->error("{}: sha256 mismatch, discarding downloaded data", file.name);
        fs::remove(tempPath, ec);
        state.setDownloaded(index, 0);
        state.setState(index, FileState::Failed);
        requestCheckpoint();
        return failed(Error{ErrorCode::ChecksumMismatch, "sha256 mismatch for " + file.name},
                      false);
    }

    fs::rename(tempPath, localPath, ec);
    if (ec) {
        state.setState(index, FileState::Failed);
        requestCheckpoint();
        return failed(Error{ErrorCode::IoError, "rename failed for " + tempPath.string() + ": " +
                                                    ec.message()},
                      true);
    }
    if (auto sr = syncDirectory(localPath.parent_path()); !sr.ok()) {
        logger_->debug("{}: {}", file.name, sr.error().message);
    }

    const auto finalSize = fs::file_size(localPath, ec);
    if (!ec)
        state.setDownloaded(index, finalSize);
    state.setState(index, FileState::Completed);
    logger_->info("{}: completed ({} bytes)", file.name, ec ? 0 : finalSize);
    requestCheckpoint();
    return TransferOutcome{FileState::Completed, std::nullopt, false};
}

} // namespace modelfetch::downloader
