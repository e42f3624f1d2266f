#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <sieve/config/pipeline_config.h>
#include <sieve/core/types.h>
#include <sieve/retrieve/corpus.h>
#include <sieve/retrieve/records.h>
#include <sieve/retrieve/scorers.h>

namespace sieve::retrieve {

struct ScoutOutput {
    std::vector<Candidate> candidates; // canonical order, at most K_A
    size_t lexicalResults = 0;
    size_t denseResults = 0;
    size_t mergedResults = 0;
    double lexicalMs = 0.0;
    double denseMs = 0.0;
    double fusionMs = 0.0;
};

/**
 * @brief Wide first pass: lexical + dense retrieval, min-max normalized and fused
 *
 * Both indexes are queried (concurrently when more than one worker is configured).
 * A chunk found by one mechanism only gets a raw 0 for the other. Each signal is
 * normalized over the merged set, fused with the configured weights, ranked and cut
 * to K_A. Two empty hit lists produce an empty candidate list.
 */
class ScoutStage {
public:
    ScoutStage(std::shared_ptr<ILexicalIndex> lexical, std::shared_ptr<IDenseIndex> dense);

    Result<ScoutOutput> run(const std::string& query, const ChunkCorpus& corpus,
                            const config::PipelineConfig& config) const;

private:
    std::shared_ptr<ILexicalIndex> lexical_;
    std::shared_ptr<IDenseIndex> dense_;
};

} // namespace sieve::retrieve
