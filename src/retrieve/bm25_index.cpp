#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <sieve/retrieve/bm25_index.h>
#include <sieve/retrieve/score_fusion.h>
#include <sieve/retrieve/tokenizer.h>

namespace sieve::retrieve {

Bm25Index::Bm25Index(const ChunkCorpus& corpus, Bm25Params params) : params_(params) {
    docIds_.reserve(corpus.size());
    docLengths_.reserve(corpus.size());

    uint64_t totalLength = 0;
    for (const auto& chunk : corpus.chunks()) {
        const auto doc = static_cast<uint32_t>(docIds_.size());
        auto tokens = tokenize(chunk.text);

        std::unordered_map<std::string, uint32_t> tf;
        for (auto& token : tokens) {
            ++tf[token];
        }
        for (auto& [term, count] : tf) {
            postings_[term].push_back(Posting{doc, count});
        }

        docIds_.push_back(chunk.chunkId);
        docLengths_.push_back(static_cast<uint32_t>(tokens.size()));
        totalLength += tokens.size();
    }

    if (!docIds_.empty()) {
        avgLength_ = static_cast<double>(totalLength) / static_cast<double>(docIds_.size());
    }
    spdlog::debug("BM25 index: {} chunks, {} terms, avg length {:.1f}", docIds_.size(),
                  postings_.size(), avgLength_);
}

double Bm25Index::idf(const std::string& term) const {
    auto it = postings_.find(term);
    if (it == postings_.end()) {
        return 0.0;
    }
    const double n = static_cast<double>(docIds_.size());
    const double df = static_cast<double>(it->second.size());
    return std::log(1.0 + (n - df + 0.5) / (df + 0.5));
}

Result<std::vector<ScoredChunk>> Bm25Index::search(const std::string& query, size_t limit) {
    std::vector<ScoredChunk> hits;
    if (limit == 0 || docIds_.empty()) {
        return hits;
    }

    std::unordered_map<uint32_t, double> scores;
    const double k1 = params_.k1;
    const double b = params_.b;
    const double avgdl = avgLength_ > 0.0 ? avgLength_ : 1.0;

    for (const auto& term : uniqueTerms(tokenize(query))) {
        auto it = postings_.find(term);
        if (it == postings_.end()) {
            continue;
        }
        const double termIdf = idf(term);
        for (const auto& posting : it->second) {
            const double tf = static_cast<double>(posting.tf);
            const double norm = k1 * (1.0 - b + b * docLengths_[posting.doc] / avgdl);
            scores[posting.doc] += termIdf * (tf * (k1 + 1.0)) / (tf + norm);
        }
    }

    hits.reserve(scores.size());
    for (const auto& [doc, score] : scores) {
        if (score > 0.0) {
            hits.push_back(ScoredChunk{docIds_[doc], score});
        }
    }
    rankAndTruncate(hits, limit, [](const ScoredChunk& h) { return RankKey{h.score, 0.0}; });
    return hits;
}

} // namespace sieve::retrieve
