#pragma once

#include <cstddef>
#include <string>
#include <sieve/retrieve/scorers.h>

namespace sieve::retrieve {

/**
 * @brief Late-interaction (MaxSim) scorer over query and chunk terms
 *
 * Every distinct query term is matched to its most similar chunk token under
 * termSimilarity(); the score is the mean of those maxima, in [0,1]. The matched chunk
 * tokens form the evidence: one entry per chunk position, highest weight first, ties by
 * earlier position.
 */
class TokenInteractionScorer : public IInteractionScorer {
public:
    struct Options {
        size_t maxTokens = 512;    // chunk tokens considered
        size_t evidenceLimit = 10; // 0 = no evidence
    };

    TokenInteractionScorer() = default;
    explicit TokenInteractionScorer(Options options) : options_(options) {}

    Result<InteractionScore> score(const std::string& query, const std::string& text) override;

private:
    Options options_;
};

} // namespace sieve::retrieve
