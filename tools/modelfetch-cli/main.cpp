#include <modelfetch/cli/modelfetch_cli.h>

#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    try {
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");
        modelfetch::cli::ModelfetchCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
