#pragma once

#include <modelfetch/downloader/downloader.hpp>

#include <spdlog/logger.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace modelfetch::downloader {

/**
 * <stateDir>/<manifestId with path separators replaced by '_'>_status.json
 */
[[nodiscard]] std::filesystem::path statusPathFor(const std::filesystem::path& stateDir,
                                                  std::string_view manifestId);

/**
 * JSON text of a record:
 * { "model_id": "...", "files": [ { "filename", "file_size", "downloaded_size", "status" } ] }
 */
[[nodiscard]] std::string serializeStatusRecord(const StatusRecord& record);

/**
 * Parse and validate a record. Any missing/mistyped field makes the whole record invalid.
 */
Expected<StatusRecord> parseStatusRecord(std::string_view text);

struct StatusStoreOptions {
    std::chrono::seconds staleTempAge{3600};
    std::chrono::seconds gcInterval{300};
};

/**
 * Create the JSON status store rooted at `stateDir` (created on first save).
 */
std::unique_ptr<IStatusStore> makeJsonStatusStore(std::filesystem::path stateDir,
                                                  std::shared_ptr<spdlog::logger> logger = {},
                                                  StatusStoreOptions options = {});

/**
 * Aggregate view of a record for display.
 */
struct StatusSummary {
    std::uint64_t totalBytes{0};
    std::uint64_t downloadedBytes{0};
    std::size_t fileCount{0};
    std::size_t completed{0};
    std::size_t failed{0};
    std::size_t stopped{0};
    std::size_t downloading{0};
    std::size_t pending{0};

    [[nodiscard]] double percent() const noexcept {
        if (totalBytes == 0)
            return 0.0;
        return static_cast<double>(downloadedBytes) * 100.0 / static_cast<double>(totalBytes);
    }
};

[[nodiscard]] StatusSummary summarizeStatus(const StatusRecord& record);

} // namespace modelfetch::downloader
