#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <cmath>
#include <thread>
#include <sieve/config/config_helpers.h>
#include <sieve/config/pipeline_config.h>
#include <sieve/retrieve/score_fusion.h>

namespace sieve::config {

namespace {

Error badValue(const std::string& key, const std::string& value, const char* expected) {
    return Error{ErrorCode::ConfigurationError,
                 "Config key '" + key + "' has invalid value '" + value + "' (expected " +
                     expected + ")"};
}

template <typename T> Result<T> parseNumber(const std::string& key, const std::string& value) {
    T out{};
    const char* first = value.data();
    const char* last = value.data() + value.size();
    if (first != last && *first == '+') {
        ++first;
    }
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last || first == last) {
        return badValue(key, value, "a number");
    }
    return out;
}

Result<size_t> parseCount(const std::string& key, const std::string& value) {
    auto parsed = parseNumber<long long>(key, value);
    if (!parsed) {
        return parsed.error();
    }
    if (parsed.value() < 0) {
        return badValue(key, value, "a non-negative integer");
    }
    return static_cast<size_t>(parsed.value());
}

Result<bool> parseBool(const std::string& key, const std::string& value) {
    std::string v;
    v.reserve(value.size());
    for (char c : value)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return badValue(key, value, "true or false");
}

} // namespace

Result<void> PipelineConfig::validate() const {
    if (kA <= 0 || kB <= 0 || kC <= 0) {
        return Error{ErrorCode::ConfigurationError,
                     "K values must be positive (K_A=" + std::to_string(kA) +
                         ", K_B=" + std::to_string(kB) + ", K_C=" + std::to_string(kC) + ")"};
    }
    if (kA < kB) {
        return Error{ErrorCode::ConfigurationError, "K_A (" + std::to_string(kA) +
                                                        ") must be >= K_B (" +
                                                        std::to_string(kB) + ")"};
    }
    if (kB < kC) {
        return Error{ErrorCode::ConfigurationError, "K_B (" + std::to_string(kB) +
                                                        ") must be >= K_C (" +
                                                        std::to_string(kC) + ")"};
    }
    if (auto weights = retrieve::validateFusionWeights(
            retrieve::FusionWeights{fusion.weightLexical, fusion.weightDense});
        !weights) {
        return weights;
    }
    if (!std::isfinite(bm25.k1) || bm25.k1 < 0.0) {
        return Error{ErrorCode::ConfigurationError, "bm25.k1 must be >= 0"};
    }
    if (!std::isfinite(bm25.b) || bm25.b < 0.0 || bm25.b > 1.0) {
        return Error{ErrorCode::ConfigurationError, "bm25.b must be within [0, 1]"};
    }
    if (dense.dimensions == 0) {
        return Error{ErrorCode::ConfigurationError, "dense.dimensions must be positive"};
    }
    if (inspector.maxTokens == 0) {
        return Error{ErrorCode::ConfigurationError, "inspector.max_tokens must be positive"};
    }
    return Result<void>();
}

size_t PipelineConfig::workerCount() const {
    if (workers > 0) {
        return workers;
    }
    unsigned int threads = std::thread::hardware_concurrency();
    if (threads == 0)
        threads = 4;
    return std::min(threads, 16u);
}

std::optional<CalibrationMethod> PipelineConfig::parseCalibrationMethod(std::string_view name) {
    std::string v;
    v.reserve(name.size());
    for (char c : name)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "isotonic")
        return CalibrationMethod::Isotonic;
    if (v == "platt" || v == "sigmoid")
        return CalibrationMethod::Platt;
    return std::nullopt;
}

Result<PipelineConfig> applyConfigValues(PipelineConfig cfg,
                                         const std::map<std::string, std::string>& values) {
    for (const auto& [key, value] : values) {
        auto setInt = [&](int& field) -> Result<void> {
            auto r = parseNumber<int>(key, value);
            if (!r)
                return r.error();
            field = r.value();
            return Result<void>();
        };
        auto setCount = [&](size_t& field) -> Result<void> {
            auto r = parseCount(key, value);
            if (!r)
                return r.error();
            field = r.value();
            return Result<void>();
        };
        auto setDouble = [&](double& field) -> Result<void> {
            auto r = parseNumber<double>(key, value);
            if (!r)
                return r.error();
            field = r.value();
            return Result<void>();
        };
        auto setBool = [&](bool& field) -> Result<void> {
            auto r = parseBool(key, value);
            if (!r)
                return r.error();
            field = r.value();
            return Result<void>();
        };

        Result<void> applied;
        if (key == "pipeline.k_a") {
            applied = setInt(cfg.kA);
        } else if (key == "pipeline.k_b") {
            applied = setInt(cfg.kB);
        } else if (key == "pipeline.k_c") {
            applied = setInt(cfg.kC);
        } else if (key == "pipeline.workers") {
            applied = setCount(cfg.workers);
        } else if (key == "bm25.k1") {
            applied = setDouble(cfg.bm25.k1);
        } else if (key == "bm25.b") {
            applied = setDouble(cfg.bm25.b);
        } else if (key == "bm25.max_results") {
            applied = setCount(cfg.bm25.maxResults);
        } else if (key == "dense.dimensions") {
            applied = setCount(cfg.dense.dimensions);
        } else if (key == "dense.max_results") {
            applied = setCount(cfg.dense.maxResults);
        } else if (key == "fusion.weight_lexical") {
            applied = setDouble(cfg.fusion.weightLexical);
        } else if (key == "fusion.weight_dense") {
            applied = setDouble(cfg.fusion.weightDense);
        } else if (key == "inspector.max_tokens") {
            applied = setCount(cfg.inspector.maxTokens);
        } else if (key == "inspector.evidence") {
            applied = setBool(cfg.inspector.evidence);
        } else if (key == "inspector.evidence_limit") {
            applied = setCount(cfg.inspector.evidenceLimit);
        } else if (key == "calibration.method") {
            auto method = PipelineConfig::parseCalibrationMethod(value);
            if (!method) {
                applied = badValue(key, value, "isotonic or platt");
            } else {
                cfg.calibration.method = *method;
            }
        } else if (key == "calibration.reference") {
            cfg.calibration.reference = value.empty() ? std::filesystem::path{}
                                                      : expand_tilde(value);
        } else {
            spdlog::debug("Ignoring unknown config key '{}'", key);
        }

        if (!applied) {
            return applied.error();
        }
    }
    return cfg;
}

Result<PipelineConfig> loadPipelineConfig(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        spdlog::debug("No config file at '{}', using defaults", path.string());
        return PipelineConfig{};
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error{ErrorCode::ConfigurationError,
                     "Config path is not a regular file: " + path.string()};
    }
    // parse_simple_toml reads an unopenable file as empty; that must not mean defaults
    if (std::ifstream reader(path); !reader) {
        return Error{ErrorCode::ConfigurationError,
                     "Cannot read config file: " + path.string()};
    }
    spdlog::debug("Loading config from {}", path.string());
    return applyConfigValues(PipelineConfig{}, parse_simple_toml(path));
}

} // namespace sieve::config
