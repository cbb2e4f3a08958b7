/*
 * modelfetch/src/downloader/download_engine.cpp
 *
 * DownloadEngine:
 * - Lists the manifest, merges the persisted status record, persists the merged view
 * - Posts one task per file to a boost::asio::thread_pool bounded by the concurrency
 * - Each task runs a bounded attempt loop with exponential backoff around FileTransferWorker
 * - Checkpoints snapshot and save under one mutex so records on disk only move forward
 */

#include <modelfetch/downloader/download_engine.hpp>
#include <modelfetch/downloader/file_transfer.hpp>
#include <modelfetch/downloader/manifest_provider.hpp>
#include <modelfetch/downloader/manifest_state.hpp>
#include <modelfetch/downloader/status_store.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <unordered_set>

namespace modelfetch::downloader {

namespace fs = std::filesystem;

bool RunReport::success() const noexcept {
    if (nothingToDo)
        return true;
    return std::all_of(files.begin(), files.end(),
                       [](const FileProgress& f) { return f.state == FileState::Completed; });
}

std::size_t RunReport::completedCount() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(files.begin(), files.end(),
                      [](const FileProgress& f) { return f.state == FileState::Completed; }));
}

std::vector<std::pair<std::string, FileState>> RunReport::incomplete() const {
    std::vector<std::pair<std::string, FileState>> out;
    for (const auto& f : files) {
        if (f.state != FileState::Completed)
            out.emplace_back(f.name, f.state);
    }
    return out;
}

namespace {

// Manifest entries must be unique by name; later duplicates are dropped.
std::vector<FileDescriptor> uniqueByName(std::vector<FileDescriptor> files,
                                         spdlog::logger& logger) {
    std::unordered_set<std::string> seen;
    std::vector<FileDescriptor> out;
    out.reserve(files.size());
    for (auto& f : files) {
        if (!seen.insert(f.name).second) {
            logger.warn("Duplicate manifest entry '{}' ignored", f.name);
            continue;
        }
        out.push_back(std::move(f));
    }
    return out;
}

} // namespace

class DownloadEngine final : public IDownloadEngine {
public:
    DownloadEngine(DownloaderConfig cfg, fs::path destDir, EngineDependencies deps)
        : cfg_(std::move(cfg)), destDir_(std::move(destDir)), deps_(std::move(deps)) {
        if (!deps_.logger)
            deps_.logger = spdlog::default_logger();
        if (!deps_.clock)
            deps_.clock = [] { return std::chrono::steady_clock::now(); };
        if (!deps_.http)
            deps_.http = makeCurlHttpAdapter(cfg_, deps_.logger);
        if (!deps_.statusStore)
            deps_.statusStore = makeJsonStatusStore(cfg_.stateDir, deps_.logger);
        if (!deps_.manifests)
            deps_.manifests =
                makeModelScopeManifestProvider(cfg_.endpoint, deps_.http, deps_.logger);
    }

    Expected<RunReport> runAll(std::string_view manifestId, int concurrency) override {
        auto& log = *deps_.logger;
        if (manifestId.empty()) {
            return Error{ErrorCode::InvalidArgument, "empty manifest id"};
        }

        auto listed = deps_.manifests->listFiles(manifestId);
        if (!listed.ok()) {
            log.error("Failed to list manifest '{}': {}", manifestId, listed.error().message);
            return listed.error();
        }
        auto files = uniqueByName(std::move(listed).value(), log);

        RunReport report;
        report.manifestId = std::string(manifestId);
        if (files.empty()) {
            log.info("Manifest '{}' has no files; nothing to do", manifestId);
            report.nothingToDo = true;
            return report;
        }

        ManifestState state(std::string(manifestId), files);
        auto prior = deps_.statusStore->load(manifestId);
        if (!prior.ok()) {
            log.warn("Ignoring prior status for '{}': {}", manifestId, prior.error().message);
        } else if (prior.value()) {
            const auto matched = state.merge(*prior.value());
            log.info("Loaded prior status for '{}' ({} of {} files known)", manifestId, matched,
                     files.size());
        }
        persist(state);

        if (concurrency <= 0)
            concurrency = cfg_.concurrency;
        const auto workers = static_cast<std::size_t>(std::max(1, concurrency));
        const auto poolSize = std::min(workers, files.size());
        log.info("Downloading {} files of '{}' into {} with {} workers", files.size(), manifestId,
                 destDir_.string(), poolSize);

        report.errors.resize(files.size());
        {
            boost::asio::thread_pool pool(poolSize);
            for (std::size_t i = 0; i < files.size(); ++i) {
                boost::asio::post(pool, [this, &files, &state, &report, i] {
                    runFile(files[i], state, i, report.errors[i]);
                });
            }
            pool.join();
        }

        persist(state);

        auto finalRecord = state.snapshot();
        report.files = std::move(finalRecord.files);
        report.stopped = stopRequested();

        log.info("'{}': {}/{} files completed", manifestId, report.completedCount(),
                 report.files.size());
        for (std::size_t i = 0; i < report.files.size(); ++i) {
            const auto& f = report.files[i];
            if (f.state == FileState::Completed)
                continue;
            log.warn("  {} [{}]{}{}", f.name, toString(f.state), report.errors[i] ? ": " : "",
                     report.errors[i].value_or(""));
        }
        return report;
    }

    void requestStop() noexcept override { stop_.store(true, std::memory_order_relaxed); }

    bool stopRequested() const noexcept override {
        return stop_.load(std::memory_order_relaxed);
    }

private:
    void runFile(const FileDescriptor& file, ManifestState& state, std::size_t index,
                 std::optional<std::string>& lastError) {
        auto& log = *deps_.logger;
        try {
            FileTransferWorker worker(cfg_, *deps_.http, deps_.logger, deps_.clock);
            const ShouldCancel shouldCancel = [this] { return stopRequested(); };
            const CheckpointFn checkpoint = [this, &state] { persist(state); };

            const int maxAttempts = std::max(1, cfg_.retry.maxAttempts);
            auto backoff = cfg_.retry.initialBackoff;
            for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
                if (stopRequested()) {
                    markStopped(file, state, index);
                    return;
                }

                auto outcome = worker.transfer(file, destDir_, state, index, checkpoint,
                                               shouldCancel);
                if (outcome.error && outcome.state != FileState::Stopped)
                    lastError = outcome.error->message;
                else if (outcome.state == FileState::Completed)
                    lastError.reset();

                if (outcome.state != FileState::Failed || !outcome.retryable)
                    return;
                if (attempt == maxAttempts) {
                    log.error("{}: giving up after {} attempts", file.name, maxAttempts);
                    return;
                }

                log.warn("{}: attempt {}/{} failed, retrying in {} ms", file.name, attempt,
                         maxAttempts, backoff.count());
                sleepUnlessStopped(backoff);
                const auto next = std::chrono::milliseconds(static_cast<std::int64_t>(
                    static_cast<double>(backoff.count()) * cfg_.retry.multiplier));
                backoff = std::min(next, cfg_.retry.maxBackoff);
            }
        } catch (const std::exception& ex) {
            log.error("{}: unexpected failure: {}", file.name, ex.what());
            lastError = ex.what();
            state.setState(index, FileState::Failed);
            persist(state);
        }
    }

    // Completed from a prior run only holds while the final file is still on disk.
    void markStopped(const FileDescriptor& file, ManifestState& state, std::size_t index) {
        if (state.get(index).state == FileState::Completed) {
            std::error_code ec;
            if (fs::is_regular_file(destDir_ / fs::path(file.name), ec))
                return;
            state.setDownloaded(index, 0);
        }
        state.setState(index, FileState::Stopped);
    }

    // Polls the stop flag: requestStop() may run in a signal handler and cannot notify.
    void sleepUnlessStopped(std::chrono::milliseconds duration) const {
        constexpr std::chrono::milliseconds kSlice{50};
        const auto deadline = std::chrono::steady_clock::now() + duration;
        while (!stopRequested()) {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
                return;
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(left, kSlice));
        }
    }

    void persist(const ManifestState& state) {
        std::lock_guard<std::mutex> lk(checkpointMutex_);
        auto r = deps_.statusStore->save(state.snapshot());
        if (!r.ok()) {
            deps_.logger->warn("Failed to persist status for '{}': {}", state.manifestId(),
                               r.error().message);
        }
    }

    DownloaderConfig cfg_;
    fs::path destDir_;
    EngineDependencies deps_;
    std::atomic<bool> stop_{false};
    std::mutex checkpointMutex_;
};

std::unique_ptr<IDownloadEngine> makeDownloadEngine(DownloaderConfig cfg, fs::path destDir,
                                                    EngineDependencies deps) {
    return std::make_unique<DownloadEngine>(std::move(cfg), std::move(destDir), std::move(deps));
}

} // namespace modelfetch::downloader
