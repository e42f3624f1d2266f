#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <vector>
#include <sieve/core/types.h>
#include <sieve/retrieve/records.h>

namespace sieve::retrieve {

/**
 * @brief Line accounting for one line-delimited JSON input
 *
 * Blank lines are ignored. A line that is not JSON, or that the record callback
 * rejects, is skipped and counted rather than failing the read.
 */
struct JsonlReadStats {
    size_t linesRead = 0;
    size_t recordsAccepted = 0;
    size_t linesSkipped = 0;
    std::optional<Error> firstSkip; // InputSchemaError naming "<file>:<line>" and the reason

    JsonlReadStats& operator+=(const JsonlReadStats& other) {
        linesRead += other.linesRead;
        recordsAccepted += other.recordsAccepted;
        linesSkipped += other.linesSkipped;
        if (!firstSkip)
            firstSkip = other.firstSkip;
        return *this;
    }
};

/// Callback receives the parsed object and its 1-based line number; returns false to
/// reject the line as an input schema error.
using JsonlRecordHandler = std::function<bool(const nlohmann::json&, size_t)>;

/// FileNotFound when the file cannot be opened; otherwise per-line failures are
/// counted in the returned stats.
Result<JsonlReadStats> readJsonl(const std::filesystem::path& path,
                                 const JsonlRecordHandler& onRecord);

/// Write one compact JSON object per line. Creates parent directories.
Result<void> writeJsonl(const std::filesystem::path& path,
                        const std::vector<nlohmann::json>& records);

/// Write a single pretty-printed JSON document (diagnostics).
Result<void> writeJsonFile(const std::filesystem::path& path, const nlohmann::json& doc);

// Record shapes on disk
nlohmann::json toJson(const Candidate& candidate);
nlohmann::json toJson(const RescoredCandidate& candidate);
nlohmann::json toJson(const FinalResult& result);

std::optional<Chunk> chunkFromJson(const nlohmann::json& j);
std::optional<Candidate> candidateFromJson(const nlohmann::json& j);
std::optional<RescoredCandidate> rescoredFromJson(const nlohmann::json& j);
std::optional<FinalResult> finalResultFromJson(const nlohmann::json& j);

} // namespace sieve::retrieve
