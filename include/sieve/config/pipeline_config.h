#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <sieve/core/types.h>

namespace sieve::config {

enum class CalibrationMethod {
    Isotonic, // pool-adjacent-violators step fit with linear interpolation
    Platt     // sigmoid fit by Newton's method
};

/**
 * @brief Configuration threaded through every stage of the funnel
 *
 * Passed by const reference; stages never hold on to it or mutate it. Values come from
 * built-in defaults, then the config file, then command line overrides, and are
 * checked with validate() before any stage runs.
 */
struct PipelineConfig {
    // Funnel widths, K_A >= K_B >= K_C >= 1
    int kA = 200;
    int kB = 50;
    int kC = 10;

    // Worker threads for per-candidate scoring (0 = hardware concurrency, capped at 16)
    size_t workers = 0;

    struct Bm25 {
        double k1 = 0.9;
        double b = 0.4;
        size_t maxResults = 0; // 0 = K_A
    } bm25;

    struct Dense {
        size_t dimensions = 256;
        size_t maxResults = 0; // 0 = K_A
    } dense;

    struct Fusion {
        double weightLexical = 0.5;
        double weightDense = 0.5;
    } fusion;

    struct Inspector {
        size_t maxTokens = 512;
        bool evidence = true;
        size_t evidenceLimit = 10;
    } inspector;

    struct Calibration {
        CalibrationMethod method = CalibrationMethod::Isotonic;
        std::filesystem::path reference; // empty = no reference set (identity, uncalibrated)
    } calibration;

    /// ConfigurationError when a K is non-positive, K_A < K_B, K_B < K_C, the fusion
    /// weights do not sum to 1 within retrieve::kFusionWeightEpsilon, or a scoring parameter is out of
    /// range.
    Result<void> validate() const;

    size_t lexicalDepth() const { return bm25.maxResults ? bm25.maxResults : widthA(); }
    size_t denseDepth() const { return dense.maxResults ? dense.maxResults : widthA(); }

    size_t widthA() const { return kA > 0 ? static_cast<size_t>(kA) : 0; }
    size_t widthB() const { return kB > 0 ? static_cast<size_t>(kB) : 0; }
    size_t widthC() const { return kC > 0 ? static_cast<size_t>(kC) : 0; }

    /// Resolved worker count, never zero
    size_t workerCount() const;

    [[nodiscard]] static constexpr const char*
    calibrationMethodToString(CalibrationMethod method) noexcept {
        switch (method) {
            case CalibrationMethod::Isotonic:
                return "isotonic";
            case CalibrationMethod::Platt:
                return "platt";
        }
        return "unknown";
    }

    static std::optional<CalibrationMethod> parseCalibrationMethod(std::string_view name);
};

/**
 * @brief Overlay flattened "section.key" values onto a config
 *
 * Unknown keys are ignored with a debug log. A value that does not parse is a
 * ConfigurationError naming the key.
 */
Result<PipelineConfig> applyConfigValues(PipelineConfig base,
                                         const std::map<std::string, std::string>& values);

/**
 * @brief Load the pipeline config from a TOML file
 *
 * A path that does not exist yields the defaults; explicit paths are checked by the
 * caller. An existing file that cannot be opened is a ConfigurationError. The result is
 * not validated.
 */
Result<PipelineConfig> loadPipelineConfig(const std::filesystem::path& path);

} // namespace sieve::config
