#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <snipren/cli/rn_cli.h>

int main(int argc, char* argv[]) {
    try {
        // stdout carries only the confirmation line; diagnostics go to stderr
        auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>("rn", stderr_sink);
        spdlog::set_default_logger(logger);

        // Conservative default; RnCLI::run() adjusts based on env, flags and config
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        snipren::cli::RnCLI cli;
        return cli.run(argc, argv);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
