#pragma once

#include <string>
#include <sieve/retrieve/scorers.h>

namespace sieve::retrieve {

/**
 * @brief Full-text pairwise relevance in [0,1]
 *
 * Combines exact query-term coverage, adjacent query bigrams found adjacent in the
 * chunk, and soft (fuzzy) term similarity. A single-term query scores its bigram
 * component as coverage.
 */
class TermPairwiseScorer : public IPairwiseScorer {
public:
    struct Weights {
        double coverage = 0.5;
        double phrase = 0.2;
        double soft = 0.3;
    };

    TermPairwiseScorer() = default;
    explicit TermPairwiseScorer(Weights weights) : weights_(weights) {}

    Result<double> score(const std::string& query, const std::string& text) override;

private:
    Weights weights_;
};

} // namespace sieve::retrieve
