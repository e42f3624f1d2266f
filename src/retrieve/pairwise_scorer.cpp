#include <algorithm>
#include <unordered_set>
#include <sieve/retrieve/pairwise_scorer.h>
#include <sieve/retrieve/tokenizer.h>

namespace sieve::retrieve {

Result<double> TermPairwiseScorer::score(const std::string& query, const std::string& text) {
    const auto queryTokens = tokenize(query);
    const auto terms = uniqueTerms(queryTokens);
    const auto tokens = tokenize(text);
    if (terms.empty() || tokens.empty()) {
        return 0.0;
    }

    const std::unordered_set<std::string> vocabulary(tokens.begin(), tokens.end());
    const auto distinctTokens = uniqueTerms(tokens);

    size_t covered = 0;
    double soft = 0.0;
    for (const auto& term : terms) {
        if (vocabulary.count(term)) {
            ++covered;
            soft += 1.0;
            continue;
        }
        double best = 0.0;
        for (const auto& token : distinctTokens) {
            best = std::max(best, termSimilarity(term, token));
        }
        soft += best;
    }
    const double n = static_cast<double>(terms.size());
    const double coverage = static_cast<double>(covered) / n;
    soft /= n;

    double phrase = coverage;
    if (queryTokens.size() >= 2) {
        std::unordered_set<std::string> chunkBigrams;
        for (size_t i = 1; i < tokens.size(); ++i) {
            chunkBigrams.insert(tokens[i - 1] + ' ' + tokens[i]);
        }
        size_t matched = 0;
        const size_t bigrams = queryTokens.size() - 1;
        for (size_t i = 1; i < queryTokens.size(); ++i) {
            if (chunkBigrams.count(queryTokens[i - 1] + ' ' + queryTokens[i])) {
                ++matched;
            }
        }
        phrase = static_cast<double>(matched) / static_cast<double>(bigrams);
    }

    const double combined =
        weights_.coverage * coverage + weights_.phrase * phrase + weights_.soft * soft;
    return std::clamp(combined, 0.0, 1.0);
}

} // namespace sieve::retrieve
