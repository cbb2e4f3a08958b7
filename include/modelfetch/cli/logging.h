#pragma once

#include <spdlog/common.h>
#include <spdlog/logger.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace modelfetch::cli {

/**
 * "trace", "debug", "info", "warn"/"warning", "error"/"err", "critical"/"crit", "off".
 * Case-insensitive; nullopt for anything else.
 */
std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view s);

/**
 * Precedence: envLevel (MODELFETCH_LOG_LEVEL) > verbose (debug) > quiet (warn) > info.
 * An unparsable envLevel is ignored.
 */
spdlog::level::level_enum resolveLogLevel(const char* envLevel, bool verbose, bool quiet);

/**
 * Build the "modelfetch" logger (colored stderr, plus a rotating file when logFile is set),
 * install it as spdlog's default and return it.
 */
std::shared_ptr<spdlog::logger> setupLogging(spdlog::level::level_enum level,
                                             const std::string& logFile);

} // namespace modelfetch::cli
