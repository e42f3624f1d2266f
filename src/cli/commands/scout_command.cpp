#include <spdlog/spdlog.h>
#include <filesystem>
#include <string>
#include <sieve/cli/command.h>
#include <sieve/cli/sieve_cli.h>
#include <sieve/retrieve/pipeline.h>

namespace sieve::cli {

class ScoutCommand : public ICommand {
public:
    std::string getName() const override { return "scout"; }

    std::string getDescription() const override {
        return "Stage A: lexical + dense retrieval, fused into the top K_A candidates";
    }

    void registerCommand(CLI::App& app, SieveCli* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("scout", getDescription());
        cmd->add_option("chunks", chunksPath_, "Chunk corpus (chunks.jsonl or a directory)")
            ->type_name("PATH")
            ->required();
        cmd->add_option("query", query_, "Free-text query")->required();
        cmd->add_option("out_dir", outDir_, "Output directory for candidates.jsonl")
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

        spdlog::debug("scout: corpus={} out={}", chunksPath_.string(), outDir_.string());
        auto summary = pipeline.value().runScout(chunksPath_, query_, outDir_);
        if (!summary) {
            return summary.error();
        }
        cli_->printSummary(summary.value());
        return Result<void>();
    }

private:
    SieveCli* cli_ = nullptr;
    std::filesystem::path chunksPath_;
    std::string query_;
    std::filesystem::path outDir_;
};

// Factory function
std::unique_ptr<ICommand> createScoutCommand() {
    return std::make_unique<ScoutCommand>();
}

} // namespace sieve::cli
