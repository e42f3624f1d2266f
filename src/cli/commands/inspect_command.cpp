#include <filesystem>
#include <string>
#include <sieve/cli/command.h>
#include <sieve/cli/sieve_cli.h>
#include <sieve/retrieve/pipeline.h>

namespace sieve::cli {

class InspectCommand : public ICommand {
public:
    std::string getName() const override { return "inspect"; }

    std::string getDescription() const override {
        return "Stage B: token-interaction re-scoring of Scout candidates down to K_B";
    }

    void registerCommand(CLI::App& app, SieveCli* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("inspect", getDescription());
        cmd->add_option("candidates", candidatesPath_, "Scout output (candidates.jsonl)")
            ->type_name("PATH")
            ->required();
        cmd->add_option("chunks", chunksPath_, "Chunk corpus (chunks.jsonl or a directory)")
            ->type_name("PATH")
            ->required();
        cmd->add_option("query", query_, "Free-text query")->required();
        cmd->add_option("out_dir", outDir_, "Output directory for rescored.jsonl")
            ->type_name("DIR")
            ->required();

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto cfg = cli_->resolveConfig();
        if (!cfg) {
            return cfg.error();
        }
        auto pipeline = retrieve::Pipeline::create(std::move(cfg).value());
        if (!pipeline) {
            return pipeline.error();
        }

        auto summary = pipeline.value().runInspect(candidatesPath_, chunksPath_, query_, outDir_);
        if (!summary) {
            return summary.error();
        }
        cli_->printSummary(summary.value());
        return Result<void>();
    }

private:
    SieveCli* cli_ = nullptr;
    std::filesystem::path candidatesPath_;
    std::filesystem::path chunksPath_;
    std::string query_;
    std::filesystem::path outDir_;
};

// Factory function
std::unique_ptr<ICommand> createInspectCommand() {
    return std::make_unique<InspectCommand>();
}

} // namespace sieve::cli
