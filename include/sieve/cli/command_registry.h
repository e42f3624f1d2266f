#pragma once

#include <memory>
#include <sieve/cli/command.h>

namespace sieve::cli {

// Forward declaration
class SieveCli;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(SieveCli* cli);

    /**
     * Create scout command (stage A)
     */
    static std::unique_ptr<ICommand> createScoutCommand();

    /**
     * Create inspect command (stage B)
     */
    static std::unique_ptr<ICommand> createInspectCommand();

    /**
     * Create judge command (stage C)
     */
    static std::unique_ptr<ICommand> createJudgeCommand();

    /**
     * Create run command (all stages)
     */
    static std::unique_ptr<ICommand> createRunCommand();
};

} // namespace sieve::cli
