#pragma once

#include <modelfetch/downloader/downloader.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace modelfetch::cli {

// "512 B", "1.50 KB", "12.34 MB", "1.02 GB"
std::string formatBytes(std::uint64_t bytes);

// Multi-line human readable status of a record (summary first, then one line per file)
std::string renderStatusText(const downloader::StatusRecord& record);

// Record plus a "summary" object with totals, per-state counts and percent
nlohmann::json statusToJson(const downloader::StatusRecord& record);

} // namespace modelfetch::cli
