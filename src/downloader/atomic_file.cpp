/*
 * modelfetch/src/downloader/atomic_file.cpp
 *
 * ScopedAtomicReplace:
 * - Temporary file in the same directory as the target (rename never crosses filesystems)
 * - O_CREAT|O_EXCL with 0600 so concurrent writers never share a temporary
 * - fsync(file) -> rename -> fsync(dir) on commit; unlink on every other exit path
 */

#include <modelfetch/downloader/atomic_file.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <random>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace modelfetch::downloader {

namespace fs = std::filesystem;

namespace {

std::atomic<std::uint64_t> g_tempCounter{0};

std::string errnoMessage(int err) {
    return std::system_category().message(err);
}

std::string uniqueSuffix() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::string out = std::to_string(::getpid());
    out.push_back('-');
    out.append(std::to_string(g_tempCounter.fetch_add(1, std::memory_order_relaxed)));
    out.push_back('-');
    out.append(std::to_string(gen() & 0xffffffffull));
    return out;
}

} // namespace

Expected<void> syncDirectory(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Error{ErrorCode::IoError,
                     "open(O_DIRECTORY) failed for " + dir.string() + ": " + errnoMessage(errno)};
    }
    if (::fsync(fd) != 0) {
        const int err = errno;
        ::close(fd);
        return Error{ErrorCode::IoError,
                     "fsync(dir) failed for " + dir.string() + ": " + errnoMessage(err)};
    }
    ::close(fd);
    return Expected<void>{};
}

ScopedAtomicReplace::ScopedAtomicReplace(fs::path target) : target_(std::move(target)) {}

ScopedAtomicReplace::~ScopedAtomicReplace() {
    if (!committed_) {
        discard();
    }
}

std::string ScopedAtomicReplace::tempPrefixFor(const fs::path& target) {
    return target.filename().string() + ".tmp-";
}

Expected<void> ScopedAtomicReplace::open() {
    if (fd_ >= 0) {
        return Error{ErrorCode::InvalidArgument, "atomic replace already open: " + temp_.string()};
    }

    auto dir = target_.parent_path();
    if (dir.empty()) {
        dir = ".";
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "Failed to create directory " + dir.string() + ": " + ec.message()};
    }

    // A collision is practically impossible; retry a few times rather than fail.
    for (int attempt = 0; attempt < 4; ++attempt) {
        temp_ = dir / (tempPrefixFor(target_) + uniqueSuffix());
        fd_ = ::open(temp_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
        if (fd_ >= 0) {
            return Expected<void>{};
        }
        if (errno != EEXIST) {
            break;
        }
    }
    const int err = errno;
    auto failed = temp_;
    temp_.clear();
    return Error{ErrorCode::IoError,
                 "Failed to create temporary file " + failed.string() + ": " + errnoMessage(err)};
}

Expected<void> ScopedAtomicReplace::write(std::span<const std::byte> data) {
    if (fd_ < 0) {
        return Error{ErrorCode::InvalidArgument, "atomic replace not open: " + target_.string()};
    }
    const auto* p = reinterpret_cast<const char*>(data.data());
    std::size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd_, p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return Error{ErrorCode::IoError,
                         "write failed on " + temp_.string() + ": " + errnoMessage(errno)};
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }
    return Expected<void>{};
}

Expected<void> ScopedAtomicReplace::write(std::string_view text) {
    return write(std::as_bytes(std::span<const char>(text.data(), text.size())));
}

Expected<void> ScopedAtomicReplace::commit() {
    if (fd_ < 0) {
        return Error{ErrorCode::InvalidArgument, "atomic replace not open: " + target_.string()};
    }

    if (::fsync(fd_) != 0) {
        return Error{ErrorCode::IoError,
                     "fsync failed on " + temp_.string() + ": " + errnoMessage(errno)};
    }
    const int closeRc = ::close(fd_);
    fd_ = -1;
    if (closeRc != 0) {
        return Error{ErrorCode::IoError,
                     "close failed on " + temp_.string() + ": " + errnoMessage(errno)};
    }

    std::error_code ec;
    fs::rename(temp_, target_, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "rename() failed (" + ec.message() + ") from " +
                                             temp_.string() + " to " + target_.string()};
    }
    committed_ = true;

    auto dir = target_.parent_path();
    auto synced = syncDirectory(dir.empty() ? fs::path{"."} : dir);
    if (!synced.ok()) {
        // The rename already happened; durability of the entry is best-effort from here.
        spdlog::debug("{}", synced.error().message);
    }
    return Expected<void>{};
}

void ScopedAtomicReplace::discard() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (!temp_.empty()) {
        std::error_code ec;
        fs::remove(temp_, ec);
        if (ec) {
            spdlog::debug("Failed to remove temporary file {}: {}", temp_.string(), ec.message());
        }
    }
}

} // namespace modelfetch::downloader
