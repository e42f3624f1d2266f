#include <filesystem>
#include <optional>
#include <string>
#include <sieve/cli/command.h>
#include <sieve/cli/sieve_cli.h>
#include <sieve/retrieve/pipeline.h>

namespace sieve::cli {

class RunCommand : public ICommand {
public:
    std::string getName() const override { return "run"; }

    std::string getDescription() const override {
        return "Run scout, inspect and judge in sequence into <out_dir>/A, B and C";
    }

    void registerCommand(CLI::App& app, SieveCli* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("run", getDescription());
        cmd->add_option("chunks", chunksPath_, "Chunk corpus (chunks.jsonl or a directory)")
            ->type_name("PATH")
            ->required();
        cmd->add_option("query", query_, "Free-text query")->required();
        cmd->add_option("out_dir", outDir_, "Output root")->type_name("DIR")->required();
        cmd->add_option("--links", linksPath_, "Note-to-patient links (note_links.jsonl)")
            ->type_name("PATH");

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

        std::optional<std::filesystem::path> links;
        if (!linksPath_.empty()) {
            links = linksPath_;
        }
        auto summaries = pipeline.value().runAll(chunksPath_, query_, outDir_, links);
        if (!summaries) {
            return summaries.error();
        }
        for (const auto& summary : summaries.value()) {
            cli_->printSummary(summary);
        }
        return Result<void>();
    }

private:
    SieveCli* cli_ = nullptr;
    std::filesystem::path chunksPath_;
    std::string query_;
    std::filesystem::path outDir_;
    std::filesystem::path linksPath_;
};

// Factory function
std::unique_ptr<ICommand> createRunCommand() {
    return std::make_unique<RunCommand>();
}

} // namespace sieve::cli
