#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <lunafmt/cli/lunafmt_cli.h>

int main(int argc, char* argv[]) {
    try {
        // User-facing messages go to stderr unadorned; LunafmtCLI::run() adjusts the level
        auto logger = spdlog::stderr_color_mt("lunafmt");
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("%v");

        lunafmt::cli::LunafmtCLI cli;
        return cli.run(argc, argv);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
