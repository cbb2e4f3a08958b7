/*
 * modelfetch download <model_id> <save_dir>
 *
 * - Flags override [downloader] values from the config file
 * - First SIGINT asks the engine to stop (partial files and the status record are kept),
 *   a second one exits immediately
 */

#include <modelfetch/cli/command.h>
#include <modelfetch/cli/modelfetch_cli.h>
#include <modelfetch/config/config_helpers.h>
#include <modelfetch/downloader/download_engine.hpp>
#include <modelfetch/downloader/manifest_provider.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <optional>

#include <unistd.h>

namespace modelfetch::cli {

namespace fs = std::filesystem;
using namespace modelfetch::downloader;

namespace {

// Routes SIGINT to the running engine for the lifetime of the guard.
class InterruptGuard {
public:
    explicit InterruptGuard(IDownloadEngine* engine) {
        signals_.store(0);
        engine_.store(engine);
        previous_ = std::signal(SIGINT, &InterruptGuard::handler);
    }

    ~InterruptGuard() {
        std::signal(SIGINT, previous_ == SIG_ERR ? SIG_DFL : previous_);
        engine_.store(nullptr);
    }

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    using Handler = void (*)(int);

    static void handler(int) {
        if (signals_.fetch_add(1) > 0) {
            std::_Exit(kExitInterrupted);
        }
        static constexpr char kMsg[] =
            "\nStopping, partial files are kept. Press Ctrl+C again to exit immediately.\n";
        [[maybe_unused]] auto n = ::write(STDERR_FILENO, kMsg, sizeof(kMsg) - 1);
        if (auto* engine = engine_.load()) {
            engine->requestStop();
        }
    }

    static inline std::atomic<IDownloadEngine*> engine_{nullptr};
    static inline std::atomic<int> signals_{0};
    Handler previous_{SIG_DFL};
};

} // namespace

class DownloadCommand : public ICommand {
public:
    std::string getName() const override { return "download"; }

    std::string getDescription() const override {
        return "Download all files of a model into a local directory (resumable)";
    }

    void registerCommand(CLI::App& app, ModelfetchCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("download", getDescription());
        cmd->add_option("model_id", modelId_, "Model id, e.g. \"deepseek-ai/DeepSeek-R1\"")
            ->required();
        cmd->add_option("save_dir", saveDir_, "Local directory for the model files")->required();

        cmd->add_option("--max-workers", maxWorkers_, "Parallel file downloads (default 4)")
            ->check(CLI::Range(1, 64));
        cmd->add_option("--chunk-size", chunkSize_, "Write buffer size in bytes (default 1MB)")
            ->check(CLI::Range(std::size_t{1}, std::size_t{1} << 30));
        cmd->add_flag("--no-verify", noVerify_, "Skip sha256 verification");
        cmd->add_option("--retry", retry_, "Attempts per file on transient errors (default 3)")
            ->check(CLI::Range(1, 100));
        cmd->add_option("--checkpoint-interval", checkpointMs_,
                        "Milliseconds between status checkpoints (default 10000)")
            ->check(CLI::Range(1, 24 * 3600 * 1000));
        cmd->add_option("--manifest", manifest_,
                        "Read the file list from a JSON manifest instead of ModelScope")
            ->check(CLI::ExistingFile);
        cmd->add_option("--endpoint", endpoint_, "ModelScope endpoint (default https://modelscope.cn)");
        cmd->add_option("--state-dir", stateDir_,
                        "Directory for status records (default ~/.modelscope_downloads)");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    int execute() override {
        auto cfg = cli_->loadConfig();
        if (maxWorkers_)
            cfg.concurrency = *maxWorkers_;
        if (chunkSize_)
            cfg.chunkSizeBytes = *chunkSize_;
        if (noVerify_)
            cfg.verifyChecksums = false;
        if (retry_)
            cfg.retry.maxAttempts = *retry_;
        if (checkpointMs_)
            cfg.checkpointInterval = std::chrono::milliseconds(*checkpointMs_);
        if (endpoint_)
            cfg.endpoint = *endpoint_;
        if (stateDir_)
            cfg.stateDir = config::expand_tilde(*stateDir_);

        auto logger = cli_->getLogger();
        EngineDependencies deps;
        deps.logger = logger;
        if (manifest_) {
            deps.manifests = makeJsonManifestProvider(config::expand_tilde(*manifest_), logger);
        }

        const fs::path destDir = config::expand_tilde(saveDir_);
        auto engine = makeDownloadEngine(cfg, destDir, std::move(deps));

        auto result = [&] {
            InterruptGuard guard(engine.get());
            return engine->runAll(modelId_, cfg.concurrency);
        }();

        if (!result.ok()) {
            const auto& err = result.error();
            fmt::print(stderr, "Error: {}\n", err.message);
            if (err.code == ErrorCode::ManifestError || err.code == ErrorCode::InvalidArgument)
                return kExitUsage;
            return kExitIncomplete;
        }

        const auto& report = result.value();
        if (report.nothingToDo) {
            fmt::print("Nothing to download for {}\n", modelId_);
            return kExitOk;
        }

        fmt::print("{}/{} files of {} downloaded to {}\n", report.completedCount(),
                   report.files.size(), modelId_, destDir.string());
        for (std::size_t i = 0; i < report.files.size(); ++i) {
            const auto& f = report.files[i];
            if (f.state == FileState::Completed)
                continue;
            const auto& err = report.errors[i];
            fmt::print("  {} [{}]{}{}\n", f.name, toString(f.state), err ? ": " : "",
                       err.value_or(""));
        }

        if (report.success())
            return kExitOk;
        if (report.stopped) {
            fmt::print("Interrupted; run the same command again to resume.\n");
            return kExitInterrupted;
        }
        return kExitIncomplete;
    }

private:
    ModelfetchCLI* cli_{nullptr};
    std::string modelId_;
    std::string saveDir_;
    std::optional<int> maxWorkers_;
    std::optional<std::size_t> chunkSize_;
    bool noVerify_{false};
    std::optional<int> retry_;
    std::optional<long long> checkpointMs_;
    std::optional<std::string> manifest_;
    std::optional<std::string> endpoint_;
    std::optional<std::string> stateDir_;
};

std::unique_ptr<ICommand> createDownloadCommand() {
    return std::make_unique<DownloadCommand>();
}

} // namespace modelfetch::cli
