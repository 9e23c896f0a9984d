#include <docseek/cli/docseek_cli.h>

#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    try {
        // Conservative default; DocseekCLI adjusts it from flags and environment
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        docseek::cli::DocseekCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
