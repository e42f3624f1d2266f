#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <sieve/cli/command.h>
#include <sieve/config/pipeline_config.h>
#include <sieve/retrieve/pipeline.h>

namespace sieve::cli {

/**
 * Main CLI application class
 */
class SieveCli {
public:
    SieveCli();
    ~SieveCli();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    /**
     * Get verbose flag
     */
    bool getVerbose() const { return verbose_; }

    /**
     * Register a command
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Defer execution of a command until after parsing and log setup
     */
    void setPendingCommand(ICommand* cmd);

    /**
     * Pipeline config for this invocation: config file, then command line overrides,
     * then validation. Any failure is a ConfigurationError.
     */
    Result<config::PipelineConfig> resolveConfig() const;

    /**
     * Print the one-line stage summary (and any skip warning) to stdout
     */
    void printSummary(const retrieve::StageSummary& summary) const;

    /**
     * Log a failed command and print it with a hint to stderr
     */
    void reportFailure(const std::string& command, const Error& error) const;

private:
    /**
     * Global tuning options that override the config file
     */
    struct Overrides {
        int kA = 0;
        int kB = 0;
        int kC = 0;
        double k1 = 0.0;
        double b = 0.0;
        double weightLexical = 0.0;
        double weightDense = 0.0;
        size_t workers = 0;
        std::string calibrationReference;
        std::string calibrationMethod;

        CLI::Option* kAOpt = nullptr;
        CLI::Option* kBOpt = nullptr;
        CLI::Option* kCOpt = nullptr;
        CLI::Option* k1Opt = nullptr;
        CLI::Option* bOpt = nullptr;
        CLI::Option* weightLexicalOpt = nullptr;
        CLI::Option* weightDenseOpt = nullptr;
        CLI::Option* workersOpt = nullptr;
        CLI::Option* calibrationOpt = nullptr;
        CLI::Option* calibrationMethodOpt = nullptr;
    };

    /**
     * Register all built-in commands
     */
    void registerBuiltinCommands();

    /**
     * Apply SIEVE_LOG_LEVEL / --verbose after parsing
     */
    void applyLogLevel() const;

    Result<config::PipelineConfig> applyOverrides(config::PipelineConfig cfg) const;

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;

    ICommand* pendingCommand_ = nullptr;

    bool verbose_ = false;
    std::string configPath_;
    Overrides overrides_;
};

} // namespace sieve::cli
