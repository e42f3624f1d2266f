#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sieve::retrieve {

/**
 * @brief Split text into lowercase terms
 *
 * ASCII letters and digits form terms; every other ASCII byte separates them. Bytes
 * >= 0x80 are kept inside terms so UTF-8 words stay whole. maxTokens = 0 means no cap.
 */
std::vector<std::string> tokenize(std::string_view text, size_t maxTokens = 0);

/// Distinct terms in first-occurrence order.
std::vector<std::string> uniqueTerms(const std::vector<std::string>& tokens);

/// Boundary-padded character trigrams of a term, sorted and de-duplicated.
std::vector<std::string> charTrigrams(std::string_view term);

/**
 * @brief Similarity of two terms in [0,1]
 *
 * 1.0 for identical terms. Containment of a term of at least three characters scores
 * by length ratio, otherwise trigram Dice overlap above a floor; unrelated terms
 * score 0. Symmetric.
 */
double termSimilarity(std::string_view a, std::string_view b);

} // namespace sieve::retrieve
