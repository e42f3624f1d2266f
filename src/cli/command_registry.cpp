#include <sieve/cli/command_registry.h>
#include <sieve/cli/sieve_cli.h>

namespace sieve::cli {

// External factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createScoutCommand();
std::unique_ptr<ICommand> createInspectCommand();
std::unique_ptr<ICommand> createJudgeCommand();
std::unique_ptr<ICommand> createRunCommand();

void CommandRegistry::registerAllCommands(SieveCli* cli) {
    cli->registerCommand(CommandRegistry::createScoutCommand());
    cli->registerCommand(CommandRegistry::createInspectCommand());
    cli->registerCommand(CommandRegistry::createJudgeCommand());
    cli->registerCommand(CommandRegistry::createRunCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createScoutCommand() {
    return ::sieve::cli::createScoutCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createInspectCommand() {
    return ::sieve::cli::createInspectCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createJudgeCommand() {
    return ::sieve::cli::createJudgeCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createRunCommand() {
    return ::sieve::cli::createRunCommand();
}

} // namespace sieve::cli
