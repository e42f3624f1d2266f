#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <sieve/retrieve/judge_stage.h>
#include <sieve/retrieve/parallel_scoring.h>
#include <sieve/retrieve/score_fusion.h>

namespace sieve::retrieve {

namespace {

struct PairwiseHit {
    const Chunk* chunk = nullptr;
    double raw = 0.0;
};

} // namespace

JudgeStage::JudgeStage(std::shared_ptr<IPairwiseScorer> scorer, ScoreCalibrator calibrator)
    : scorer_(std::move(scorer)), calibrator_(std::move(calibrator)) {}

Result<JudgeOutput> JudgeStage::run(const std::string& query,
                                    std::vector<RescoredCandidate> candidates,
                                    const ChunkCorpus& corpus,
                                    const config::PipelineConfig& config,
                                    const NoteLinkTable* links) const {
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    if (!scorer_) {
        return Error{ErrorCode::InvalidArgument, "Judge stage requires a pairwise scorer"};
    }

    JudgeOutput out;
    out.calibrated = calibrator_.calibrated();
    out.inputCount = candidates.size();
    out.duplicatesDropped = dropDuplicateIds(candidates);
    if (out.duplicatesDropped > 0) {
        spdlog::warn("Judge: dropped {} duplicate candidate(s)", out.duplicatesDropped);
    }
    if (candidates.empty()) {
        return out;
    }

    auto& scorer = *scorer_;
    const auto start = std::chrono::steady_clock::now();
    auto scored = scoreAll<PairwiseHit>(
        "Judge", candidates, config.workerCount(),
        [&](const RescoredCandidate& c) -> Result<PairwiseHit> {
            const Chunk* chunk = corpus.find(c.chunkId);
            if (!chunk) {
                return Error{ErrorCode::NotFound, "chunk not found in corpus"};
            }
            auto raw = scorer.score(query, chunk->text);
            if (!raw) {
                return Error{ErrorCode::ScorerFailure, raw.error().message};
            }
            if (!std::isfinite(raw.value())) {
                return Error{ErrorCode::ScorerFailure, "pairwise score is not finite"};
            }
            return PairwiseHit{chunk, raw.value()};
        });
    if (!scored) {
        return scored.error();
    }
    const auto& hits = scored.value();

    std::vector<double> raw;
    std::vector<double> calibrated;
    raw.reserve(hits.size());
    calibrated.reserve(hits.size());
    for (const auto& hit : hits) {
        raw.push_back(hit.raw);
        calibrated.push_back(calibrator_.apply(hit.raw));
        if (!out.calibrated && (hit.raw < 0.0 || hit.raw > 1.0))
            ++out.rawOutOfRange;
    }
    if (out.rawOutOfRange > 0) {
        spdlog::warn("Judge: {} of {} raw pairwise scores fall outside [0,1] and are clamped "
                     "by the identity mapping ({}); configure a calibration reference to "
                     "keep their order",
                     out.rawOutOfRange, hits.size(), calibrator_.reason());
    }
    enforceMonotonic(raw, calibrated);

    out.results.reserve(hits.size());
    for (size_t i = 0; i < hits.size(); ++i) {
        const Chunk& chunk = *hits[i].chunk;
        FinalResult r;
        r.chunkId = chunk.chunkId;
        r.rawScore = raw[i];
        r.calibratedScore = std::clamp(calibrated[i], 0.0, 1.0);
        r.calibrated = out.calibrated;
        r.pointer = ChunkPointer{chunk.sourceNoteId, chunk.offset};
        if (links) {
            r.patientUid = links->patientFor(chunk.sourceNoteId);
        }
        out.results.push_back(std::move(r));
    }
    out.scoringMs =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
            .count();

    rankAndTruncate(out.results, config.widthC(),
                    [](const FinalResult& r) { return RankKey{r.calibratedScore, 0.0}; });
    for (const auto& r : out.results) {
        if (r.patientUid)
            ++out.patientUidAttached;
    }
    return out;
}

} // namespace sieve::retrieve
