#pragma once

#include <modelfetch/cli/command.h>
#include <modelfetch/downloader/downloader.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace modelfetch::cli {

// Process exit codes
inline constexpr int kExitOk = 0;
inline constexpr int kExitIncomplete = 1;
inline constexpr int kExitUsage = 2;
inline constexpr int kExitInterrupted = 130;

/**
 * Top-level command line: global flags, logging setup, and dispatch to one subcommand.
 */
class ModelfetchCLI {
public:
    ModelfetchCLI();
    ~ModelfetchCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    /**
     * Called from a subcommand's CLI11 callback; the command runs after logging is configured.
     */
    void setPendingCommand(ICommand* cmd);

    /**
     * Resolved config file (--config, MODELFETCH_CONFIG, XDG default)
     */
    std::filesystem::path getConfigPath() const;

    /**
     * DownloaderConfig from the config file; subcommands apply their flags on top.
     */
    downloader::DownloaderConfig loadConfig() const;

    std::shared_ptr<spdlog::logger> getLogger() const { return logger_; }

private:
    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_{nullptr};
    std::shared_ptr<spdlog::logger> logger_;

    bool verbose_{false};
    bool quiet_{false};
    std::string logFile_;
    std::string configPath_;
};

/**
 * Factories for the built-in commands
 */
std::unique_ptr<ICommand> createDownloadCommand();
std::unique_ptr<ICommand> createStatusCommand();

} // namespace modelfetch::cli
