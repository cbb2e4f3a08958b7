#include <modelfetch/cli/logging.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <filesystem>
#include <vector>

namespace modelfetch::cli {

std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

spdlog::level::level_enum resolveLogLevel(const char* envLevel, bool verbose, bool quiet) {
    if (envLevel && *envLevel) {
        if (auto lvl = parseLogLevel(envLevel))
            return *lvl;
    }
    if (verbose)
        return spdlog::level::debug;
    if (quiet)
        return spdlog::level::warn;
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> setupLogging(spdlog::level::level_enum level,
                                             const std::string& logFile) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!logFile.empty()) {
        try {
            std::error_code ec;
            const auto parent = std::filesystem::path(logFile).parent_path();
            if (!parent.empty())
                std::filesystem::create_directories(parent, ec);
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 5;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile, max_size, max_files));
        } catch (const spdlog::spdlog_ex& ex) {
            // Keep logging to stderr only
            spdlog::warn("Cannot open log file {}: {}", logFile, ex.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("modelfetch", sinks.begin(), sinks.end());
    logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    return logger;
}

} // namespace modelfetch::cli
