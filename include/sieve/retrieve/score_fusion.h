#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>
#include <sieve/core/types.h>

namespace sieve::retrieve {

/**
 * @brief Min-max normalization to [0,1]
 *
 * normalized = (raw - min) / (max - min). When every score is equal (one element,
 * all zeros, any uniform set) every element normalizes to 1.0.
 */
std::vector<double> minMaxNormalize(const std::vector<double>& raw);

struct FusionWeights {
    double lexical = 0.5;
    double dense = 0.5;
};

inline constexpr double kFusionWeightEpsilon = 1e-6;

/// ConfigurationError unless both weights are finite, non-negative and sum to 1.0
/// within epsilon.
Result<void> validateFusionWeights(const FusionWeights& weights,
                                   double epsilon = kFusionWeightEpsilon);

/// Weighted sum of two normalized scores, clamped to [0,1].
double fuseScores(const FusionWeights& weights, double normalizedLexical,
                  double normalizedDense);

/**
 * @brief Stage ordering key, compared descending field by field
 *
 * Scout and Judge rank on primary only; Inspector puts the carried fusion score in
 * secondary.
 */
struct RankKey {
    double primary = 0.0;
    double secondary = 0.0;
};

/**
 * @brief The ordering contract shared by every stage
 *
 * primary descending, secondary descending, then chunkId ascending. Scores must be
 * finite so the order is total and independent of input order.
 */
template <typename T, typename KeyFn> bool rankedBefore(const T& a, const T& b, KeyFn& key) {
    const RankKey ka = key(a);
    const RankKey kb = key(b);
    if (ka.primary != kb.primary)
        return ka.primary > kb.primary;
    if (ka.secondary != kb.secondary)
        return ka.secondary > kb.secondary;
    return a.chunkId < b.chunkId;
}

/// Sort in the canonical order and keep the first `limit` items.
template <typename T, typename KeyFn>
void rankAndTruncate(std::vector<T>& items, size_t limit, KeyFn key) {
    std::sort(items.begin(), items.end(),
              [&key](const T& a, const T& b) { return rankedBefore(a, b, key); });
    if (items.size() > limit) {
        items.erase(items.begin() + static_cast<std::ptrdiff_t>(limit), items.end());
    }
}

/// True when items already satisfy the canonical order.
template <typename T, typename KeyFn>
bool isCanonicallyRanked(const std::vector<T>& items, KeyFn key) {
    for (size_t i = 1; i < items.size(); ++i) {
        if (!rankedBefore(items[i - 1], items[i], key)) {
            return false;
        }
    }
    return true;
}

/// Remove later repeats of a chunkId, keeping first occurrences in order. Returns the
/// number removed.
template <typename T> size_t dropDuplicateIds(std::vector<T>& items) {
    std::unordered_set<std::string> seen;
    const size_t before = items.size();
    items.erase(std::remove_if(items.begin(), items.end(),
                               [&seen](const T& item) { return !seen.insert(item.chunkId).second; }),
                items.end());
    return before - items.size();
}

} // namespace sieve::retrieve
