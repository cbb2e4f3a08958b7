#pragma once

#include <CLI/CLI.hpp>

#include <string>

namespace modelfetch::cli {

class ModelfetchCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "download", "status")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, ModelfetchCLI* cli) = 0;

    /**
     * Execute the command; returns the process exit code
     */
    virtual int execute() = 0;
};

} // namespace modelfetch::cli
