#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <sieve/config/pipeline_config.h>
#include <sieve/core/types.h>
#include <sieve/retrieve/calibration.h>
#include <sieve/retrieve/corpus.h>
#include <sieve/retrieve/records.h>
#include <sieve/retrieve/scorers.h>

namespace sieve::retrieve {

struct JudgeOutput {
    std::vector<FinalResult> results; // canonical order, at most K_C
    size_t inputCount = 0;
    size_t duplicatesDropped = 0;
    size_t patientUidAttached = 0;
    bool calibrated = false;
    size_t rawOutOfRange = 0; // uncalibrated only: raw scores the identity clamp flattened
    double scoringMs = 0.0;
};

/**
 * @brief Narrow final pass: precise pairwise scoring plus monotonic calibration
 *
 * Raw scores go through the calibrator and then enforceMonotonic(), so a strictly lower
 * raw score never ends up with a strictly higher calibrated score. Patient ids come
 * from the optional link table; an unlinked note leaves patientUid empty.
 *
 * Without a calibration fit the identity clamp flattens raw scores outside [0,1], so
 * their order is lost; the stage counts them and warns once.
 */
class JudgeStage {
public:
    JudgeStage(std::shared_ptr<IPairwiseScorer> scorer, ScoreCalibrator calibrator);

    Result<JudgeOutput> run(const std::string& query, std::vector<RescoredCandidate> candidates,
                            const ChunkCorpus& corpus, const config::PipelineConfig& config,
                            const NoteLinkTable* links = nullptr) const;

    const ScoreCalibrator& calibrator() const { return calibrator_; }

private:
    std::shared_ptr<IPairwiseScorer> scorer_;
    ScoreCalibrator calibrator_;
};

} // namespace sieve::retrieve
