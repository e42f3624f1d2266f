#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <future>
#include <map>
#include <sieve/retrieve/score_fusion.h>
#include <sieve/retrieve/scout_stage.h>

namespace sieve::retrieve {

namespace {

using Clock = std::chrono::steady_clock;

double elapsedMs(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

struct TimedHits {
    Result<std::vector<ScoredChunk>> hits;
    double ms = 0.0;
};

template <typename Index>
TimedHits timedSearch(Index& index, const char* name, const std::string& query, size_t limit) {
    const auto start = Clock::now();
    try {
        auto hits = index.search(query, limit);
        if (!hits) {
            return {Error{ErrorCode::ScorerFailure,
                          std::string(name) + " index: " + hits.error().message},
                    elapsedMs(start)};
        }
        return {std::move(hits), elapsedMs(start)};
    } catch (const std::exception& e) {
        return {Error{ErrorCode::ScorerFailure, std::string(name) + " index: " + e.what()},
                elapsedMs(start)};
    }
}

struct MergedScores {
    double lexical = 0.0;
    double dense = 0.0;
    bool hasLexical = false;
    bool hasDense = false;
};

// Returns an error message for a non-finite score, empty otherwise
std::string mergeHits(const std::vector<ScoredChunk>& hits, bool lexical,
                      std::map<std::string, MergedScores>& merged) {
    for (const auto& hit : hits) {
        if (!std::isfinite(hit.score)) {
            return fmt::format("{} index returned a non-finite score for chunk '{}'",
                               lexical ? "lexical" : "dense", hit.chunkId);
        }
        auto& entry = merged[hit.chunkId];
        double& slot = lexical ? entry.lexical : entry.dense;
        bool& seen = lexical ? entry.hasLexical : entry.hasDense;
        // A chunk listed twice by one index keeps its best score
        slot = seen ? std::max(slot, hit.score) : hit.score;
        seen = true;
    }
    return {};
}

} // namespace

ScoutStage::ScoutStage(std::shared_ptr<ILexicalIndex> lexical, std::shared_ptr<IDenseIndex> dense)
    : lexical_(std::move(lexical)), dense_(std::move(dense)) {}

Result<ScoutOutput> ScoutStage::run(const std::string& query, const ChunkCorpus& corpus,
                                    const config::PipelineConfig& config) const {
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    if (!lexical_ || !dense_) {
        return Error{ErrorCode::InvalidArgument, "Scout stage requires a lexical and a dense index"};
    }

    ScoutOutput out;

    TimedHits lexical{std::vector<ScoredChunk>{}};
    TimedHits dense{std::vector<ScoredChunk>{}};
    if (config.workerCount() > 1) {
        auto lexFuture = std::async(std::launch::async, [&]() {
            return timedSearch(*lexical_, "lexical", query, config.lexicalDepth());
        });
        dense = timedSearch(*dense_, "dense", query, config.denseDepth());
        lexical = lexFuture.get();
    } else {
        lexical = timedSearch(*lexical_, "lexical", query, config.lexicalDepth());
        dense = timedSearch(*dense_, "dense", query, config.denseDepth());
    }
    out.lexicalMs = lexical.ms;
    out.denseMs = dense.ms;

    for (auto* result : {&lexical, &dense}) {
        if (!result->hits) {
            return Error{result->hits.error().code,
                         "Scout stage failed with 0 candidates scored: " +
                             result->hits.error().message};
        }
    }

    const auto fusionStart = Clock::now();
    const auto& lexHits = lexical.hits.value();
    const auto& denseHits = dense.hits.value();
    out.lexicalResults = lexHits.size();
    out.denseResults = denseHits.size();

    // Ordered by chunk id so the fused set does not depend on index output order
    std::map<std::string, MergedScores> merged;
    if (auto bad = mergeHits(lexHits, true, merged); !bad.empty()) {
        return Error{ErrorCode::ScorerFailure, "Scout stage: " + bad};
    }
    if (auto bad = mergeHits(denseHits, false, merged); !bad.empty()) {
        return Error{ErrorCode::ScorerFailure, "Scout stage: " + bad};
    }
    out.mergedResults = merged.size();

    if (merged.empty()) {
        spdlog::info("Scout: no lexical or dense hits for query");
        out.fusionMs = elapsedMs(fusionStart);
        return out;
    }

    std::vector<double> rawLexical;
    std::vector<double> rawDense;
    rawLexical.reserve(merged.size());
    rawDense.reserve(merged.size());
    for (const auto& [id, scores] : merged) {
        rawLexical.push_back(scores.lexical);
        rawDense.push_back(scores.dense);
    }
    const auto normLexical = minMaxNormalize(rawLexical);
    const auto normDense = minMaxNormalize(rawDense);
    const FusionWeights weights{config.fusion.weightLexical, config.fusion.weightDense};

    out.candidates.reserve(merged.size());
    size_t i = 0;
    for (const auto& [id, scores] : merged) {
        const Chunk* chunk = corpus.find(id);
        if (!chunk) {
            return Error{ErrorCode::NotFound,
                         "Scout stage: index returned chunk '" + id + "' missing from the corpus"};
        }
        Candidate c;
        c.chunkId = id;
        c.sourceNoteId = chunk->sourceNoteId;
        c.lexicalScore = normLexical[i];
        c.denseScore = normDense[i];
        c.fusionScore = fuseScores(weights, normLexical[i], normDense[i]);
        out.candidates.push_back(std::move(c));
        ++i;
    }

    rankAndTruncate(out.candidates, config.widthA(),
                    [](const Candidate& c) { return RankKey{c.fusionScore, 0.0}; });
    out.fusionMs = elapsedMs(fusionStart);

    spdlog::debug("Scout: lexical={} dense={} merged={} kept={}", out.lexicalResults,
                  out.denseResults, out.mergedResults, out.candidates.size());
    return out;
}

} // namespace sieve::retrieve
