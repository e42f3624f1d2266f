#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sieve/config/pipeline_config.h>
#include <sieve/core/types.h>
#include <sieve/retrieve/corpus.h>
#include <sieve/retrieve/scorers.h>

namespace sieve::retrieve {

inline constexpr const char* kCandidatesFile = "candidates.jsonl";
inline constexpr const char* kRescoredFile = "rescored.jsonl";
inline constexpr const char* kFinalFile = "final.jsonl";
inline constexpr const char* kDiagnosticsFile = "diagnostics.json";

/**
 * @brief Scoring capabilities used by the stages
 *
 * A null member is replaced by the built-in backend (BM25, hashed dense, token
 * interaction, term pairwise) built over the corpus loaded for the run.
 */
struct PipelineBackends {
    std::shared_ptr<ILexicalIndex> lexical;
    std::shared_ptr<IDenseIndex> dense;
    std::shared_ptr<IInteractionScorer> interaction;
    std::shared_ptr<IPairwiseScorer> pairwise;
};

/// Fill every null backend with its built-in implementation.
PipelineBackends withDefaultBackends(PipelineBackends backends, const ChunkCorpus& corpus,
                                     const config::PipelineConfig& config);

/**
 * @brief What one stage run produced, for the CLI summary line
 */
struct StageSummary {
    std::string stage;
    size_t inputCount = 0;
    size_t outputCount = 0;
    size_t limit = 0;
    size_t skippedLines = 0; // schema skips across every input the stage read
    double elapsedMs = 0.0;
    std::optional<bool> calibrated; // judge only
    std::filesystem::path output;
    nlohmann::json diagnostics;
};

/**
 * @brief Sequences Scout -> Inspector -> Judge with file I/O at stage boundaries
 *
 * Each stage reads its inputs from disk, runs, and writes `<out_dir>/<stage file>` and
 * `<out_dir>/diagnostics.json`. Stage outputs carry no timing, so repeating a run
 * with the same query, corpus and config rewrites them byte for byte.
 */
class Pipeline {
public:
    /// ConfigurationError if the config fails validation.
    static Result<Pipeline> create(config::PipelineConfig config, PipelineBackends backends = {});

    Result<StageSummary> runScout(const std::filesystem::path& corpusPath,
                                  const std::string& query,
                                  const std::filesystem::path& outDir) const;

    Result<StageSummary> runInspect(const std::filesystem::path& candidatesPath,
                                    const std::filesystem::path& corpusPath,
                                    const std::string& query,
                                    const std::filesystem::path& outDir) const;

    Result<StageSummary> runJudge(const std::filesystem::path& rescoredPath,
                                  const std::filesystem::path& corpusPath,
                                  const std::string& query, const std::filesystem::path& outDir,
                                  const std::optional<std::filesystem::path>& linksPath = {}) const;

    /// All three stages into outDir/A, outDir/B and outDir/C.
    Result<std::vector<StageSummary>>
    runAll(const std::filesystem::path& corpusPath, const std::string& query,
           const std::filesystem::path& outDir,
           const std::optional<std::filesystem::path>& linksPath = {}) const;

    const config::PipelineConfig& config() const { return config_; }

private:
    Pipeline(config::PipelineConfig config, PipelineBackends backends)
        : config_(std::move(config)), backends_(std::move(backends)) {}

    config::PipelineConfig config_;
    PipelineBackends backends_;
};

} // namespace sieve::retrieve
