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

struct InspectorOutput {
    std::vector<RescoredCandidate> candidates; // canonical order, at most K_B
    size_t inputCount = 0;
    size_t duplicatesDropped = 0;
    double scoringMs = 0.0;
};

/**
 * @brief Mid-cost re-scoring of Scout candidates
 *
 * Ranks purely by interaction score; the Scout fusion score is carried unchanged and
 * only breaks ties, ahead of chunk id.
 */
class InspectorStage {
public:
    explicit InspectorStage(std::shared_ptr<IInteractionScorer> scorer);

    Result<InspectorOutput> run(const std::string& query, std::vector<Candidate> candidates,
                                const ChunkCorpus& corpus,
                                const config::PipelineConfig& config) const;

private:
    std::shared_ptr<IInteractionScorer> scorer_;
};

} // namespace sieve::retrieve
