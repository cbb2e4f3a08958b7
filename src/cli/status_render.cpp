#include <modelfetch/cli/status_render.h>
#include <modelfetch/downloader/status_store.hpp>

#include <fmt/format.h>

namespace modelfetch::cli {

std::string formatBytes(std::uint64_t bytes) {
    constexpr double kKiB = 1024.0;
    const auto b = static_cast<double>(bytes);
    if (bytes < 1024)
        return fmt::format("{} B", bytes);
    if (b < kKiB * kKiB)
        return fmt::format("{:.2f} KB", b / kKiB);
    if (b < kKiB * kKiB * kKiB)
        return fmt::format("{:.2f} MB", b / (kKiB * kKiB));
    return fmt::format("{:.2f} GB", b / (kKiB * kKiB * kKiB));
}

std::string renderStatusText(const downloader::StatusRecord& record) {
    const auto s = downloader::summarizeStatus(record);
    std::string out;
    out += fmt::format("Model: {}\n", record.manifestId);
    out += fmt::format("Progress: {:.1f}% ({} / {})\n", s.percent(),
                       formatBytes(s.downloadedBytes), formatBytes(s.totalBytes));
    out += fmt::format("Files: {} total, {} completed, {} failed, {} stopped, {} downloading, "
                       "{} pending\n",
                       s.fileCount, s.completed, s.failed, s.stopped, s.downloading, s.pending);
    for (const auto& f : record.files) {
        out += fmt::format("  [{:<11}] {} ({} / {})\n", downloader::toString(f.state), f.name,
                           formatBytes(f.downloadedBytes), formatBytes(f.expectedSize));
    }
    return out;
}

nlohmann::json statusToJson(const downloader::StatusRecord& record) {
    auto j = nlohmann::json::parse(downloader::serializeStatusRecord(record));
    const auto s = downloader::summarizeStatus(record);
    j["summary"] = {{"total_bytes", s.totalBytes},       {"downloaded_bytes", s.downloadedBytes},
                    {"file_count", s.fileCount},         {"completed", s.completed},
                    {"failed", s.failed},                {"stopped", s.stopped},
                    {"downloading", s.downloading},      {"pending", s.pending},
                    {"percent", s.percent()}};
    return j;
}

} // namespace modelfetch::cli
