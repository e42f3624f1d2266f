#include <spdlog/spdlog.h>
#include <exception>
#include <sieve/cli/sieve_cli.h>

int main(int argc, char* argv[]) {
    try {
        // Set up logging with conservative default; SieveCli::run() adjusts based on flags
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        sieve::cli::SieveCli cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
