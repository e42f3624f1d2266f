#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <fstream>
#include <sieve/retrieve/jsonl.h>

namespace sieve::retrieve {

using json = nlohmann::json;

namespace {

bool isNonEmptyString(const json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_string() && !it->get_ref<const std::string&>().empty();
}

std::optional<double> finiteNumber(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return std::nullopt;
    }
    double v = it->get<double>();
    if (!std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

std::string optionalString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return {};
}

Result<void> ensureParent(const std::filesystem::path& path) {
    auto parent = path.parent_path();
    if (parent.empty()) {
        return Result<void>();
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return Error{ErrorCode::WriteError,
                     "Cannot create directory " + parent.string() + ": " + ec.message()};
    }
    return Result<void>();
}

} // namespace

Result<JsonlReadStats> readJsonl(const std::filesystem::path& path,
                                 const JsonlRecordHandler& onRecord) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open " + path.string()};
    }

    JsonlReadStats stats;
    std::string line;
    size_t lineNo = 0;
    auto skip = [&](const char* reason) {
        ++stats.linesSkipped;
        Error err{ErrorCode::InputSchemaError,
                  fmt::format("{}:{}: {}", path.string(), lineNo, reason)};
        spdlog::debug("{}, skipped", err.message);
        if (!stats.firstSkip)
            stats.firstSkip = std::move(err);
    };
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        ++stats.linesRead;

        json parsed = json::parse(line, nullptr, /*allow_exceptions=*/false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            skip("not a JSON object");
            continue;
        }
        if (!onRecord(parsed, lineNo)) {
            skip("unexpected record shape");
            continue;
        }
        ++stats.recordsAccepted;
    }
    if (in.bad()) {
        return Error{ErrorCode::InvalidData, "Read error on " + path.string()};
    }

    if (stats.linesSkipped > 0) {
        spdlog::warn("{}: {}, skipped {} of {} lines (first: {})", path.string(),
                     errorToString(stats.firstSkip->code), stats.linesSkipped, stats.linesRead,
                     stats.firstSkip->message);
    }
    return stats;
}

Result<void> writeJsonl(const std::filesystem::path& path, const std::vector<json>& records) {
    if (auto r = ensureParent(path); !r) {
        return r;
    }
    std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out) {
        return Error{ErrorCode::WriteError, "Cannot open " + path.string() + " for writing"};
    }
    for (const auto& record : records) {
        out << record.dump() << '\n';
    }
    out.flush();
    if (!out) {
        return Error{ErrorCode::WriteError, "Failed writing " + path.string()};
    }
    return Result<void>();
}

Result<void> writeJsonFile(const std::filesystem::path& path, const json& doc) {
    if (auto r = ensureParent(path); !r) {
        return r;
    }
    std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out) {
        return Error{ErrorCode::WriteError, "Cannot open " + path.string() + " for writing"};
    }
    out << doc.dump(2) << '\n';
    out.flush();
    if (!out) {
        return Error{ErrorCode::WriteError, "Failed writing " + path.string()};
    }
    return Result<void>();
}

json toJson(const Candidate& candidate) {
    return json{{"chunk_id", candidate.chunkId},
                {"s_lexical", candidate.lexicalScore},
                {"s_dense", candidate.denseScore},
                {"fusion_score", candidate.fusionScore},
                {"source_note_id", candidate.sourceNoteId}};
}

json toJson(const RescoredCandidate& candidate) {
    json j{{"chunk_id", candidate.chunkId},
           {"s_interaction", candidate.interactionScore},
           {"fusion_score", candidate.fusionScore}};
    if (candidate.evidence) {
        json evidence = json::array();
        for (const auto& e : *candidate.evidence) {
            evidence.push_back(
                json{{"token", e.token}, {"weight", e.weight}, {"position", e.position}});
        }
        j["evidence"] = std::move(evidence);
    }
    return j;
}

json toJson(const FinalResult& result) {
    json j{{"chunk_id", result.chunkId},
           {"calibrated_score", result.calibratedScore},
           {"raw_score", result.rawScore},
           {"calibrated", result.calibrated}};
    j["patient_uid"] = result.patientUid ? json(*result.patientUid) : json(nullptr);
    j["pointer"] = json{{"source_note_id", result.pointer.sourceNoteId},
                        {"offset", result.pointer.offset}};
    return j;
}

std::optional<Chunk> chunkFromJson(const json& j) {
    if (!isNonEmptyString(j, "chunk_id")) {
        return std::nullopt;
    }
    auto note = j.find("source_note_id");
    auto text = j.find("text");
    auto offset = j.find("offset");
    if (note == j.end() || !note->is_string() || text == j.end() || !text->is_string() ||
        offset == j.end() || !offset->is_number_integer()) {
        return std::nullopt;
    }
    Chunk chunk;
    chunk.chunkId = j["chunk_id"].get<std::string>();
    chunk.sourceNoteId = note->get<std::string>();
    chunk.text = text->get<std::string>();
    chunk.offset = offset->get<int64_t>();
    if (chunk.offset < 0) {
        return std::nullopt;
    }
    return chunk;
}

std::optional<Candidate> candidateFromJson(const json& j) {
    if (!isNonEmptyString(j, "chunk_id")) {
        return std::nullopt;
    }
    auto fusion = finiteNumber(j, "fusion_score");
    if (!fusion) {
        return std::nullopt;
    }
    Candidate c;
    c.chunkId = j["chunk_id"].get<std::string>();
    c.sourceNoteId = optionalString(j, "source_note_id");
    c.lexicalScore = finiteNumber(j, "s_lexical").value_or(0.0);
    c.denseScore = finiteNumber(j, "s_dense").value_or(0.0);
    c.fusionScore = *fusion;
    return c;
}

std::optional<RescoredCandidate> rescoredFromJson(const json& j) {
    if (!isNonEmptyString(j, "chunk_id")) {
        return std::nullopt;
    }
    auto interaction = finiteNumber(j, "s_interaction");
    auto fusion = finiteNumber(j, "fusion_score");
    if (!interaction || !fusion) {
        return std::nullopt;
    }
    RescoredCandidate c;
    c.chunkId = j["chunk_id"].get<std::string>();
    c.sourceNoteId = optionalString(j, "source_note_id");
    c.interactionScore = *interaction;
    c.fusionScore = *fusion;

    if (auto it = j.find("evidence"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            return std::nullopt;
        }
        std::vector<EvidenceToken> evidence;
        for (const auto& e : *it) {
            if (!e.is_object() || !e.contains("token") || !e["token"].is_string()) {
                return std::nullopt;
            }
            auto weight = finiteNumber(e, "weight");
            auto pos = e.find("position");
            if (!weight || pos == e.end() || !pos->is_number_unsigned()) {
                return std::nullopt;
            }
            evidence.push_back(
                EvidenceToken{e["token"].get<std::string>(), *weight, pos->get<size_t>()});
        }
        c.evidence = std::move(evidence);
    }
    return c;
}

std::optional<FinalResult> finalResultFromJson(const json& j) {
    if (!isNonEmptyString(j, "chunk_id")) {
        return std::nullopt;
    }
    auto calibrated = finiteNumber(j, "calibrated_score");
    auto pointer = j.find("pointer");
    if (!calibrated || pointer == j.end() || !pointer->is_object()) {
        return std::nullopt;
    }
    FinalResult r;
    r.chunkId = j["chunk_id"].get<std::string>();
    r.calibratedScore = *calibrated;
    r.rawScore = finiteNumber(j, "raw_score").value_or(*calibrated);
    if (auto it = j.find("calibrated"); it != j.end() && it->is_boolean()) {
        r.calibrated = it->get<bool>();
    }
    if (auto it = j.find("patient_uid"); it != j.end() && it->is_string()) {
        r.patientUid = it->get<std::string>();
    }
    r.pointer.sourceNoteId = optionalString(*pointer, "source_note_id");
    if (auto it = pointer->find("offset"); it != pointer->end() && it->is_number_integer()) {
        r.pointer.offset = it->get<int64_t>();
    }
    return r;
}

} // namespace sieve::retrieve
