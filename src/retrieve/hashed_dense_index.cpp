#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <sieve/retrieve/hashed_dense_index.h>
#include <sieve/retrieve/score_fusion.h>
#include <sieve/retrieve/tokenizer.h>

namespace sieve::retrieve {

namespace {

constexpr float kTermWeight = 1.0f;
constexpr float kTrigramWeight = 0.5f;

uint64_t fnv1a(std::string_view s, uint64_t seed) {
    uint64_t h = 14695981039346656037ULL ^ seed;
    for (char c : s) {
        h ^= static_cast<unsigned char>(c);
        h *= 1099511628211ULL;
    }
    return h;
}

void addFeature(std::vector<float>& vec, std::string_view feature, uint64_t seed,
                float weight) {
    const uint64_t h = fnv1a(feature, seed);
    const size_t bucket = static_cast<size_t>(h % vec.size());
    vec[bucket] += (h >> 63) ? -weight : weight;
}

} // namespace

HashedDenseIndex::HashedDenseIndex(const ChunkCorpus& corpus, size_t dimensions)
    : dimensions_(dimensions == 0 ? 1 : dimensions) {
    docIds_.reserve(corpus.size());
    matrix_.reserve(corpus.size() * dimensions_);
    for (const auto& chunk : corpus.chunks()) {
        auto row = embed(chunk.text);
        matrix_.insert(matrix_.end(), row.begin(), row.end());
        docIds_.push_back(chunk.chunkId);
    }
    spdlog::debug("Hashed dense index: {} chunks x {} dims", docIds_.size(), dimensions_);
}

std::vector<float> HashedDenseIndex::embed(std::string_view text) const {
    std::vector<float> vec(dimensions_, 0.0f);
    for (const auto& term : tokenize(text)) {
        addFeature(vec, term, 0, kTermWeight);
        for (const auto& gram : charTrigrams(term)) {
            addFeature(vec, gram, 1, kTrigramWeight);
        }
    }

    double norm = 0.0;
    for (float v : vec) {
        norm += static_cast<double>(v) * v;
    }
    if (norm > 0.0) {
        const auto inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (float& v : vec) {
            v *= inv;
        }
    }
    return vec;
}

Result<std::vector<ScoredChunk>> HashedDenseIndex::search(const std::string& query,
                                                          size_t limit) {
    std::vector<ScoredChunk> hits;
    if (limit == 0 || docIds_.empty()) {
        return hits;
    }

    const auto q = embed(query);
    for (size_t doc = 0; doc < docIds_.size(); ++doc) {
        const float* row = matrix_.data() + doc * dimensions_;
        double dot = 0.0;
        for (size_t i = 0; i < dimensions_; ++i) {
            dot += static_cast<double>(q[i]) * row[i];
        }
        if (dot > 0.0) {
            hits.push_back(ScoredChunk{docIds_[doc], std::min(dot, 1.0)});
        }
    }
    rankAndTruncate(hits, limit, [](const ScoredChunk& h) { return RankKey{h.score, 0.0}; });
    return hits;
}

} // namespace sieve::retrieve
