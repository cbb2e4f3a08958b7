#include <modelfetch/cli/logging.h>
#include <modelfetch/cli/modelfetch_cli.h>
#include <modelfetch/config/config_helpers.h>
#include <modelfetch/version.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>

namespace modelfetch::cli {

ModelfetchCLI::ModelfetchCLI() {
    // Conservative default until flags are parsed in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("Resumable, verified downloads of ModelScope models",
                                      "modelfetch");
    app_->set_version_flag("--version", MODELFETCH_VERSION_LONG_STRING);
    app_->require_subcommand(1);

    app_->add_flag("-v,--verbose", verbose_, "Enable debug logging");
    app_->add_flag("-q,--quiet", quiet_, "Only log warnings and errors");
    app_->add_option("--log-file", logFile_, "Also write logs to this file (rotated at 10MB)");
    app_->add_option("--config", configPath_,
                     "Config file (default: $MODELFETCH_CONFIG or "
                     "~/.config/modelfetch/config.toml)");

    commands_.push_back(createDownloadCommand());
    commands_.push_back(createStatusCommand());
    for (auto& cmd : commands_) {
        cmd->registerCommand(*app_, this);
    }
}

ModelfetchCLI::~ModelfetchCLI() = default;

void ModelfetchCLI::setPendingCommand(ICommand* cmd) {
    pendingCommand_ = cmd;
}

std::filesystem::path ModelfetchCLI::getConfigPath() const {
    return config::get_config_path(configPath_);
}

downloader::DownloaderConfig ModelfetchCLI::loadConfig() const {
    return config::loadDownloaderConfig(getConfigPath());
}

int ModelfetchCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int rc = app_->exit(e);
        return rc == 0 ? kExitOk : kExitUsage;
    }

    // Precedence: env MODELFETCH_LOG_LEVEL > --verbose > --quiet > info
    const auto level = resolveLogLevel(std::getenv("MODELFETCH_LOG_LEVEL"), verbose_, quiet_);
    logger_ = setupLogging(level, logFile_);

    if (!pendingCommand_) {
        std::cerr << app_->help();
        return kExitUsage;
    }

    try {
        return pendingCommand_->execute();
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        std::cerr << "Unexpected error: " << e.what() << "\n";
        logger_->error("Unexpected error: {}", e.what());
        return kExitIncomplete;
    }
}

} // namespace modelfetch::cli
