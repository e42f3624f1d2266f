#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <sieve/config/pipeline_config.h>
#include <sieve/core/types.h>
#include <sieve/retrieve/jsonl.h>

namespace sieve::retrieve {

using config::CalibrationMethod;

/**
 * @brief One labelled point of the reference calibration set
 */
struct CalibrationSample {
    double score = 0.0;
    bool relevant = false;
};

struct CalibrationSet {
    std::vector<CalibrationSample> samples;
    JsonlReadStats stats;
};

/**
 * @brief Read `{"score": <number>, "label": <0|1|bool>}` lines
 *
 * Lines with a non-finite score or a label other than 0/1/true/false are skipped and
 * counted.
 */
Result<CalibrationSet> loadCalibrationSet(const std::filesystem::path& path);

/**
 * @brief Monotonic mapping from raw pairwise scores to [0,1]
 *
 * Isotonic fits are a pool-adjacent-violators step function, interpolated linearly
 * between block edges and held flat beyond the observed range. Platt fits are a
 * sigmoid p = 1 / (1 + exp(-(a*s + b))) found by Newton's method, and are rejected
 * unless a > 0.
 *
 * When the reference set cannot support a fit (empty, one class, one distinct score,
 * a non-increasing sigmoid) the calibrator is the identity clamped to [0,1] and
 * calibrated() is false.
 */
class ScoreCalibrator {
public:
    struct Knot {
        double score;
        double probability;
    };

    /// Identity mapping; `reason` says why no fit was made.
    static ScoreCalibrator identity(std::string reason);

    static ScoreCalibrator fit(const std::vector<CalibrationSample>& samples,
                               CalibrationMethod method);

    double apply(double raw) const;

    bool calibrated() const { return calibrated_; }
    CalibrationMethod method() const { return method_; }
    const std::string& reason() const { return reason_; }

    const std::vector<Knot>& knots() const { return knots_; }
    double slope() const { return slope_; }
    double intercept() const { return intercept_; }

private:
    ScoreCalibrator() = default;

    static ScoreCalibrator fitIsotonic(const std::vector<CalibrationSample>& sorted);
    static ScoreCalibrator fitPlatt(const std::vector<CalibrationSample>& sorted);

    bool calibrated_ = false;
    CalibrationMethod method_ = CalibrationMethod::Isotonic;
    std::string reason_;
    std::vector<Knot> knots_; // isotonic, ascending score, non-decreasing probability
    double slope_ = 0.0;      // platt
    double intercept_ = 0.0;  // platt
};

/**
 * @brief Build the calibrator for a run
 *
 * An empty reference path yields the identity. A reference that cannot be read is an
 * error; one that cannot be fit falls back to identity with a warning.
 */
Result<ScoreCalibrator> loadCalibrator(const std::filesystem::path& reference,
                                       CalibrationMethod method);

/**
 * @brief Repair any monotonicity violation in a calibrated batch
 *
 * Walks the batch in ascending raw order and raises each calibrated value to the
 * running maximum, so raw(a) < raw(b) implies calibrated(a) <= calibrated(b).
 * Both vectors must have the same length.
 */
void enforceMonotonic(const std::vector<double>& raw, std::vector<double>& calibrated);

} // namespace sieve::retrieve
