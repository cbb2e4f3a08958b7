#pragma once

#include <modelfetch/downloader/downloader.hpp>

#include <spdlog/logger.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace modelfetch::downloader {

/**
 * Outcome of one runAll() over a manifest.
 */
struct RunReport {
    std::string manifestId;
    bool nothingToDo{false};
    bool stopped{false};
    std::vector<FileProgress> files;                 // manifest order
    std::vector<std::optional<std::string>> errors;  // last error per file, parallel to files

    [[nodiscard]] bool success() const noexcept;
    [[nodiscard]] std::size_t completedCount() const noexcept;
    [[nodiscard]] std::vector<std::pair<std::string, FileState>> incomplete() const;
};

/**
 * Collaborators of the engine. Missing members are filled with the production defaults
 * (ModelScope provider, libcurl adapter, JSON status store under cfg.stateDir,
 * spdlog::default_logger(), steady_clock).
 */
struct EngineDependencies {
    std::shared_ptr<IManifestProvider> manifests;
    std::shared_ptr<IHttpAdapter> http;
    std::shared_ptr<IStatusStore> statusStore;
    std::shared_ptr<spdlog::logger> logger;
    Clock clock;
};

class IDownloadEngine {
public:
    virtual ~IDownloadEngine() = default;

    /**
     * Download every file of `manifestId` with at most `concurrency` parallel transfers
     * (<= 0 selects the configured default). Fails only when the manifest cannot be listed;
     * per-file failures are reported in the RunReport.
     */
    virtual Expected<RunReport> runAll(std::string_view manifestId, int concurrency = 0) = 0;

    /**
     * Ask in-flight transfers to stop and pending ones not to start. Only stores an atomic
     * flag, so it may be called from a signal handler.
     */
    virtual void requestStop() noexcept = 0;

    [[nodiscard]] virtual bool stopRequested() const noexcept = 0;
};

std::unique_ptr<IDownloadEngine> makeDownloadEngine(DownloaderConfig cfg,
                                                    std::filesystem::path destDir,
                                                    EngineDependencies deps = {});

} // namespace modelfetch::downloader
