#pragma once

#include <modelfetch/downloader/downloader.hpp>

#include <filesystem>
#include <span>
#include <string_view>

namespace modelfetch::downloader {

/**
 * Scoped atomic replace of a single file.
 *
 * open() creates a uniquely named temporary file next to the target; write() appends to it;
 * commit() fsyncs, renames onto the target and fsyncs the directory. If commit() is never
 * reached (or fails), the destructor removes the temporary file and the target keeps its
 * previous content.
 */
class ScopedAtomicReplace {
public:
    explicit ScopedAtomicReplace(std::filesystem::path target);
    ~ScopedAtomicReplace();

    ScopedAtomicReplace(const ScopedAtomicReplace&) = delete;
    ScopedAtomicReplace& operator=(const ScopedAtomicReplace&) = delete;

    Expected<void> open();
    Expected<void> write(std::span<const std::byte> data);
    Expected<void> write(std::string_view text);
    Expected<void> commit();

    [[nodiscard]] const std::filesystem::path& target() const noexcept { return target_; }
    [[nodiscard]] const std::filesystem::path& tempPath() const noexcept { return temp_; }

    /**
     * Prefix shared by every temporary file created for `target` (used for stale-temp GC).
     */
    [[nodiscard]] static std::string tempPrefixFor(const std::filesystem::path& target);

private:
    void discard() noexcept;

    std::filesystem::path target_;
    std::filesystem::path temp_;
    int fd_{-1};
    bool committed_{false};
};

/**
 * fsync a directory so that a rename inside it is durable.
 */
Expected<void> syncDirectory(const std::filesystem::path& dir);

} // namespace modelfetch::downloader
