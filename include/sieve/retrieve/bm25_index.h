#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include <sieve/retrieve/corpus.h>
#include <sieve/retrieve/scorers.h>

namespace sieve::retrieve {

struct Bm25Params {
    double k1 = 0.9;
    double b = 0.4;
};

/**
 * @brief In-memory Okapi BM25 index over a corpus snapshot
 *
 * idf(t) = ln(1 + (N - df + 0.5) / (df + 0.5)), so every matching term contributes a
 * positive amount. Only chunks sharing at least one query term are returned.
 */
class Bm25Index : public ILexicalIndex {
public:
    Bm25Index(const ChunkCorpus& corpus, Bm25Params params = {});

    Result<std::vector<ScoredChunk>> search(const std::string& query, size_t limit) override;

    size_t documentCount() const { return docIds_.size(); }
    size_t vocabularySize() const { return postings_.size(); }
    double averageLength() const { return avgLength_; }

    double idf(const std::string& term) const;

private:
    struct Posting {
        uint32_t doc;
        uint32_t tf;
    };

    Bm25Params params_;
    std::vector<std::string> docIds_;
    std::vector<uint32_t> docLengths_;
    std::unordered_map<std::string, std::vector<Posting>> postings_;
    double avgLength_ = 0.0;
};

} // namespace sieve::retrieve
