#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <sieve/retrieve/corpus.h>
#include <sieve/retrieve/scorers.h>

namespace sieve::retrieve {

/**
 * @brief Dense index over deterministic feature-hashed embeddings
 *
 * Each term and each of its boundary-padded character trigrams is hashed (FNV-1a) into
 * one of `dimensions` buckets with a hash-derived sign; the vector is L2-normalized and
 * similarity is cosine. Only chunks with positive similarity are returned.
 */
class HashedDenseIndex : public IDenseIndex {
public:
    HashedDenseIndex(const ChunkCorpus& corpus, size_t dimensions = 256);

    Result<std::vector<ScoredChunk>> search(const std::string& query, size_t limit) override;

    /// Unit-length embedding of text, or all zeros when text has no terms.
    std::vector<float> embed(std::string_view text) const;

    size_t dimensions() const { return dimensions_; }
    size_t documentCount() const { return docIds_.size(); }

private:
    size_t dimensions_;
    std::vector<std::string> docIds_;
    std::vector<float> matrix_; // row-major, one row per chunk
};

} // namespace sieve::retrieve
