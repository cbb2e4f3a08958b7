#include <modelfetch/cli/command.h>
#include <modelfetch/cli/modelfetch_cli.h>
#include <modelfetch/cli/status_render.h>
#include <modelfetch/config/config_helpers.h>
#include <modelfetch/downloader/status_store.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <optional>

namespace modelfetch::cli {

class StatusCommand : public ICommand {
public:
    std::string getName() const override { return "status"; }

    std::string getDescription() const override {
        return "Show the saved download progress of a model";
    }

    void registerCommand(CLI::App& app, ModelfetchCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("status", getDescription());
        cmd->add_option("model_id", modelId_, "Model id")->required();
        cmd->add_flag("--json", json_, "Print the record and summary as JSON");
        cmd->add_option("--state-dir", stateDir_,
                        "Directory for status records (default ~/.modelscope_downloads)");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    int execute() override {
        const auto stateDir = stateDir_ ? config::expand_tilde(*stateDir_)
                                        : config::get_state_dir(cli_->getConfigPath());
        auto store = downloader::makeJsonStatusStore(stateDir, cli_->getLogger());

        auto loaded = store->load(modelId_);
        if (!loaded.ok()) {
            fmt::print(stderr, "Error: {}\n", loaded.error().message);
            return kExitIncomplete;
        }
        if (!loaded.value()) {
            fmt::print(stderr, "No download status found for {}\n", modelId_);
            return kExitIncomplete;
        }

        const auto& record = *loaded.value();
        if (json_) {
            fmt::print("{}\n", statusToJson(record).dump(2));
        } else {
            fmt::print("{}", renderStatusText(record));
        }
        return kExitOk;
    }

private:
    ModelfetchCLI* cli_{nullptr};
    std::string modelId_;
    bool json_{false};
    std::optional<std::string> stateDir_;
};

std::unique_ptr<ICommand> createStatusCommand() {
    return std::make_unique<StatusCommand>();
}

} // namespace modelfetch::cli
