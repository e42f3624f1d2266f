#include <fmt/format.h>
#include <cmath>
#include <sieve/retrieve/score_fusion.h>

namespace sieve::retrieve {

std::vector<double> minMaxNormalize(const std::vector<double>& raw) {
    if (raw.empty()) {
        return {};
    }

    auto [minIt, maxIt] = std::minmax_element(raw.begin(), raw.end());
    const double minScore = *minIt;
    const double maxScore = *maxIt;

    // Uniform set: no ordering information, keep every member at the top
    if (maxScore == minScore) {
        return std::vector<double>(raw.size(), 1.0);
    }

    const double range = maxScore - minScore;
    std::vector<double> out;
    out.reserve(raw.size());
    for (double score : raw) {
        out.push_back(std::clamp((score - minScore) / range, 0.0, 1.0));
    }
    return out;
}

Result<void> validateFusionWeights(const FusionWeights& weights, double epsilon) {
    if (!std::isfinite(weights.lexical) || !std::isfinite(weights.dense) ||
        weights.lexical < 0.0 || weights.dense < 0.0) {
        return Error{ErrorCode::ConfigurationError,
                     "Fusion weights must be finite and non-negative"};
    }
    const double sum = weights.lexical + weights.dense;
    if (std::fabs(sum - 1.0) > epsilon) {
        return Error{ErrorCode::ConfigurationError,
                     fmt::format("Fusion weights must sum to 1.0 (lexical={} + dense={} = {})",
                                 weights.lexical, weights.dense, sum)};
    }
    return Result<void>();
}

double fuseScores(const FusionWeights& weights, double normalizedLexical,
                  double normalizedDense) {
    const double fused = weights.lexical * normalizedLexical + weights.dense * normalizedDense;
    return std::clamp(fused, 0.0, 1.0);
}

} // namespace sieve::retrieve
