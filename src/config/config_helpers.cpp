#include <fstream>
#include <modelfetch/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <limits>

namespace modelfetch::config {

std::optional<long long> parse_integer(std::string_view s) {
    std::string text(s);
    trim(text);
    // TOML allows '_' as a digit separator
    text.erase(std::remove(text.begin(), text.end(), '_'), text.end());
    if (text.empty())
        return std::nullopt;
    long long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size())
        return std::nullopt;
    return value;
}

std::optional<bool> parse_bool(std::string_view s) {
    std::string text(s);
    trim(text);
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "true" || text == "1" || text == "yes" || text == "on")
        return true;
    if (text == "false" || text == "0" || text == "no" || text == "off")
        return false;
    return std::nullopt;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments (outside of quotes)
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Support both "downloader.key" at top level and "[downloader] key"
        if ((in_target_section && k == key) ||
            (!section.empty() && currentSection.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("MODELFETCH_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "modelfetch" / "config.toml";
    }

    return configHome / "modelfetch" / "config.toml";
}

std::filesystem::path get_state_dir(const std::filesystem::path& config_path) {
    // 1) MODELFETCH_STATE_DIR env
    if (const char* env = std::getenv("MODELFETCH_STATE_DIR"); env && *env) {
        return expand_tilde(env);
    }

    // 2) config.toml downloader.state_dir
    if (!config_path.empty()) {
        if (auto v = parse_config_value(config_path, "downloader", "state_dir"); !v.empty()) {
            return expand_tilde(v);
        }
    }

    // 3) Default
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".modelscope_downloads";
    }
    return std::filesystem::current_path() / ".modelscope_downloads";
}

namespace {

template <typename T>
void apply_integer(const std::filesystem::path& path, const char* key, long long min, T& out) {
    const auto raw = parse_config_value(path, "downloader", key);
    if (raw.empty())
        return;
    auto v = parse_integer(raw);
    if (!v || *v < min ||
        static_cast<unsigned long long>(*v) >
            static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
        spdlog::warn("Ignoring invalid downloader.{} = '{}' in {}", key, raw, path.string());
        return;
    }
    out = static_cast<T>(*v);
}

void apply_millis(const std::filesystem::path& path, const char* key,
                  std::chrono::milliseconds& out) {
    long long ms = out.count();
    apply_integer(path, key, 1, ms);
    out = std::chrono::milliseconds(ms);
}

} // namespace

downloader::DownloaderConfig loadDownloaderConfig(const std::filesystem::path& config_path) {
    downloader::DownloaderConfig cfg;
    cfg.stateDir = get_state_dir(config_path);

    std::error_code ec;
    if (config_path.empty() || !std::filesystem::exists(config_path, ec)) {
        return cfg;
    }
    spdlog::debug("Loading downloader settings from {}", config_path.string());

    apply_integer(config_path, "concurrency", 1, cfg.concurrency);
    apply_integer(config_path, "chunk_size", 1, cfg.chunkSizeBytes);
    apply_integer(config_path, "max_retry", 1, cfg.retry.maxAttempts);
    apply_integer(config_path, "checkpoint_bytes", 1, cfg.checkpointBytes);
    apply_millis(config_path, "checkpoint_interval_ms", cfg.checkpointInterval);
    apply_millis(config_path, "connect_timeout_ms", cfg.connectTimeout);
    apply_millis(config_path, "stall_timeout_ms", cfg.stallTimeout);

    if (auto raw = parse_config_value(config_path, "downloader", "verify"); !raw.empty()) {
        if (auto b = parse_bool(raw)) {
            cfg.verifyChecksums = *b;
        } else {
            spdlog::warn("Ignoring invalid downloader.verify = '{}' in {}", raw,
                         config_path.string());
        }
    }
    if (auto raw = parse_config_value(config_path, "downloader", "endpoint"); !raw.empty()) {
        cfg.endpoint = raw;
    }
    return cfg;
}

} // namespace modelfetch::config
