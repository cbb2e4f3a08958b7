#pragma once

#include <modelfetch/downloader/downloader.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace modelfetch::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion ("~" and "~/...")
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        if (const char* home = std::getenv("HOME")) {
            if (path.size() <= 2)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Value parsing; nullopt when the text is not a valid value of the type
std::optional<long long> parse_integer(std::string_view s);
std::optional<bool> parse_bool(std::string_view s);

// Parse a value from TOML config file ("" when absent)
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Config file location: override, else $MODELFETCH_CONFIG, else
/// $XDG_CONFIG_HOME/modelfetch/config.toml or ~/.config/modelfetch/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Status record directory: $MODELFETCH_STATE_DIR, else [downloader] state_dir, else
/// ~/.modelscope_downloads
std::filesystem::path get_state_dir(const std::filesystem::path& config_path = {});

/// DownloaderConfig with the [downloader] section of `config_path` applied over the defaults.
/// Invalid values are logged and ignored; a missing file yields the defaults.
downloader::DownloaderConfig loadDownloaderConfig(const std::filesystem::path& config_path);

} // namespace modelfetch::config
