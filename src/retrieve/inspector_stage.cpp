#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <sieve/retrieve/inspector_stage.h>
#include <sieve/retrieve/parallel_scoring.h>
#include <sieve/retrieve/score_fusion.h>

namespace sieve::retrieve {

InspectorStage::InspectorStage(std::shared_ptr<IInteractionScorer> scorer)
    : scorer_(std::move(scorer)) {}

Result<InspectorOutput> InspectorStage::run(const std::string& query,
                                            std::vector<Candidate> candidates,
                                            const ChunkCorpus& corpus,
                                            const config::PipelineConfig& config) const {
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    if (!scorer_) {
        return Error{ErrorCode::InvalidArgument, "Inspector stage requires an interaction scorer"};
    }

    InspectorOutput out;
    out.inputCount = candidates.size();
    out.duplicatesDropped = dropDuplicateIds(candidates);
    if (out.duplicatesDropped > 0) {
        spdlog::warn("Inspector: dropped {} duplicate candidate(s)", out.duplicatesDropped);
    }
    if (candidates.empty()) {
        return out;
    }

    const bool keepEvidence = config.inspector.evidence && config.inspector.evidenceLimit > 0;
    const size_t evidenceLimit = config.inspector.evidenceLimit;
    auto& scorer = *scorer_;

    const auto start = std::chrono::steady_clock::now();
    auto scored = scoreAll<RescoredCandidate>(
        "Inspector", candidates, config.workerCount(),
        [&](const Candidate& c) -> Result<RescoredCandidate> {
            const Chunk* chunk = corpus.find(c.chunkId);
            if (!chunk) {
                return Error{ErrorCode::NotFound, "chunk not found in corpus"};
            }
            auto interaction = scorer.score(query, chunk->text);
            if (!interaction) {
                return Error{ErrorCode::ScorerFailure, interaction.error().message};
            }
            if (!std::isfinite(interaction.value().score)) {
                return Error{ErrorCode::ScorerFailure, "interaction score is not finite"};
            }

            RescoredCandidate r;
            r.chunkId = c.chunkId;
            r.sourceNoteId = c.sourceNoteId;
            r.interactionScore = interaction.value().score;
            r.fusionScore = c.fusionScore;
            if (keepEvidence) {
                auto evidence = std::move(interaction).value().evidence;
                std::stable_sort(evidence.begin(), evidence.end(),
                                 [](const EvidenceToken& a, const EvidenceToken& b) {
                                     if (a.weight != b.weight)
                                         return a.weight > b.weight;
                                     return a.position < b.position;
                                 });
                if (evidence.size() > evidenceLimit)
                    evidence.resize(evidenceLimit);
                // No matching tokens: leave the field absent rather than empty
                if (!evidence.empty())
                    r.evidence = std::move(evidence);
            }
            return r;
        });
    if (!scored) {
        return scored.error();
    }
    out.candidates = std::move(scored).value();
    out.scoringMs =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
            .count();

    rankAndTruncate(out.candidates, config.widthB(), [](const RescoredCandidate& r) {
        return RankKey{r.interactionScore, r.fusionScore};
    });
    return out;
}

} // namespace sieve::retrieve
