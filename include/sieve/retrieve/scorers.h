#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <sieve/core/types.h>
#include <sieve/retrieve/records.h>

namespace sieve::retrieve {

/**
 * @brief A chunk id with the raw score one retrieval mechanism gave it
 */
struct ScoredChunk {
    std::string chunkId;
    double score = 0.0;
};

/**
 * @brief Query contract of a prebuilt lexical index
 *
 * Implementations are read-only once built and may be queried from several threads.
 */
class ILexicalIndex {
public:
    virtual ~ILexicalIndex() = default;

    /**
     * @brief Raw-scored chunk ids matching the query
     *
     * @param query Free-text query
     * @param limit Maximum number of hits (the index may return fewer)
     * @return Hits in any order, ids unique, or error
     */
    virtual Result<std::vector<ScoredChunk>> search(const std::string& query, size_t limit) = 0;
};

/**
 * @brief Query contract of a prebuilt dense/vector index
 */
class IDenseIndex {
public:
    virtual ~IDenseIndex() = default;

    virtual Result<std::vector<ScoredChunk>> search(const std::string& query, size_t limit) = 0;
};

struct InteractionScore {
    double score = 0.0;
    std::vector<EvidenceToken> evidence; // descending weight
};

/**
 * @brief Token-level interaction between a query and one chunk text
 *
 * Called concurrently for different chunks; implementations must not keep per-call
 * mutable state. A failure is reported by returning an Error or by throwing.
 */
class IInteractionScorer {
public:
    virtual ~IInteractionScorer() = default;

    virtual Result<InteractionScore> score(const std::string& query, const std::string& text) = 0;
};

/**
 * @brief Precise relevance of a (query, chunk text) pair
 *
 * The raw score only needs to be comparable across calls; the Judge calibrates it.
 */
class IPairwiseScorer {
public:
    virtual ~IPairwiseScorer() = default;

    virtual Result<double> score(const std::string& query, const std::string& text) = 0;
};

} // namespace sieve::retrieve
