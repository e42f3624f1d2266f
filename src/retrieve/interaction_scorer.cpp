#include <algorithm>
#include <unordered_map>
#include <utility>
#include <vector>
#include <sieve/retrieve/interaction_scorer.h>
#include <sieve/retrieve/tokenizer.h>

namespace sieve::retrieve {

Result<InteractionScore> TokenInteractionScorer::score(const std::string& query,
                                                       const std::string& text) {
    InteractionScore out;
    const auto queryTerms = uniqueTerms(tokenize(query));
    const auto tokens = tokenize(text, options_.maxTokens);
    if (queryTerms.empty() || tokens.empty()) {
        return out;
    }

    // First position of each distinct chunk token
    std::vector<std::pair<std::string, size_t>> distinct;
    {
        std::unordered_map<std::string, size_t> seen;
        for (size_t pos = 0; pos < tokens.size(); ++pos) {
            if (seen.emplace(tokens[pos], pos).second) {
                distinct.emplace_back(tokens[pos], pos);
            }
        }
    }

    std::unordered_map<size_t, double> bestByPosition;
    double total = 0.0;
    for (const auto& term : queryTerms) {
        double best = 0.0;
        size_t bestPos = 0;
        // distinct is in position order, so a strict improvement keeps the earliest match
        for (const auto& [token, pos] : distinct) {
            const double sim = termSimilarity(term, token);
            if (sim > best) {
                best = sim;
                bestPos = pos;
                if (best >= 1.0)
                    break;
            }
        }
        total += best;
        if (best > 0.0) {
            auto& weight = bestByPosition[bestPos];
            weight = std::max(weight, best);
        }
    }
    out.score = std::clamp(total / static_cast<double>(queryTerms.size()), 0.0, 1.0);

    if (options_.evidenceLimit == 0) {
        return out;
    }
    out.evidence.reserve(bestByPosition.size());
    for (const auto& [pos, weight] : bestByPosition) {
        out.evidence.push_back(EvidenceToken{tokens[pos], weight, pos});
    }
    std::sort(out.evidence.begin(), out.evidence.end(),
              [](const EvidenceToken& a, const EvidenceToken& b) {
                  if (a.weight != b.weight)
                      return a.weight > b.weight;
                  return a.position < b.position;
              });
    if (out.evidence.size() > options_.evidenceLimit) {
        out.evidence.resize(options_.evidenceLimit);
    }
    return out;
}

} // namespace sieve::retrieve
