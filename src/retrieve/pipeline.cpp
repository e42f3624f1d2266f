#include <spdlog/spdlog.h>
#include <chrono>
#include <sieve/retrieve/bm25_index.h>
#include <sieve/retrieve/calibration.h>
#include <sieve/retrieve/hashed_dense_index.h>
#include <sieve/retrieve/inspector_stage.h>
#include <sieve/retrieve/interaction_scorer.h>
#include <sieve/retrieve/jsonl.h>
#include <sieve/retrieve/judge_stage.h>
#include <sieve/retrieve/pairwise_scorer.h>
#include <sieve/retrieve/pipeline.h>
#include <sieve/retrieve/scout_stage.h>

namespace sieve::retrieve {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

using Clock = std::chrono::steady_clock;

double msSince(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

struct LoadedCorpus {
    ChunkCorpus corpus;
    double ms = 0.0;
};

Result<LoadedCorpus> loadCorpus(const fs::path& path) {
    const auto start = Clock::now();
    auto corpus = ChunkCorpus::load(path);
    if (!corpus) {
        return corpus.error();
    }
    LoadedCorpus loaded{std::move(corpus).value(), msSince(start)};
    if (loaded.corpus.loadStats().linesSkipped > 0) {
        spdlog::warn("Corpus {}: skipped {} line(s)", path.string(),
                     loaded.corpus.loadStats().linesSkipped);
    }
    return loaded;
}

template <typename T, typename FromJson>
Result<std::vector<T>> readRecords(const fs::path& path, FromJson fromJson,
                                   JsonlReadStats& stats) {
    std::vector<T> records;
    auto read = readJsonl(path, [&](const json& j, size_t) {
        auto record = fromJson(j);
        if (!record)
            return false;
        records.push_back(std::move(*record));
        return true;
    });
    if (!read) {
        return read.error();
    }
    stats = read.value();
    return records;
}

template <typename T> std::vector<json> toJsonLines(const std::vector<T>& records) {
    std::vector<json> lines;
    lines.reserve(records.size());
    for (const auto& r : records) {
        lines.push_back(toJson(r));
    }
    return lines;
}

Result<void> writeStageFiles(const fs::path& outDir, const char* fileName,
                             const std::vector<json>& lines, const json& diagnostics) {
    if (auto r = writeJsonl(outDir / fileName, lines); !r) {
        return r;
    }
    return writeJsonFile(outDir / kDiagnosticsFile, diagnostics);
}

// Fails the stage with its name in front of the cause
Error stageError(const char* stage, const Error& cause) {
    return Error{cause.code, std::string(stage) + ": " + cause.message};
}

Result<StageSummary> scoutOn(const config::PipelineConfig& config,
                             const PipelineBackends& backends, const ChunkCorpus& corpus,
                             const std::string& query, const fs::path& outDir,
                             json timing) {
    const auto start = Clock::now();
    ScoutStage stage(backends.lexical, backends.dense);
    auto result = stage.run(query, corpus, config);
    if (!result) {
        return result.error();
    }
    const auto& out = result.value();
    timing["lexical"] = out.lexicalMs;
    timing["dense"] = out.denseMs;
    timing["fusion"] = out.fusionMs;

    StageSummary summary;
    summary.stage = "scout";
    summary.inputCount = out.mergedResults;
    summary.outputCount = out.candidates.size();
    summary.limit = config.widthA();
    summary.skippedLines = corpus.loadStats().linesSkipped;
    summary.output = outDir / kCandidatesFile;

    const auto writeStart = Clock::now();
    summary.diagnostics = json{{"stage", "scout"},
                               {"query", query},
                               {"total_chunks", corpus.size()},
                               {"lexical_results", out.lexicalResults},
                               {"dense_results", out.denseResults},
                               {"input_candidates", out.mergedResults},
                               {"output_candidates", out.candidates.size()},
                               {"k", config.widthA()},
                               {"fusion_weights",
                                {{"lexical", config.fusion.weightLexical},
                                 {"dense", config.fusion.weightDense}}},
                               {"bm25", {{"k1", config.bm25.k1}, {"b", config.bm25.b}}},
                               {"skipped", {{"chunks", corpus.loadStats().linesSkipped}}}};
    if (const auto& firstSkip = corpus.loadStats().firstSkip) {
        summary.diagnostics["skipped"]["first_chunk_error"] = firstSkip->message;
    }
    timing["total"] = msSince(start) + timing.value("load", 0.0) + timing.value("index", 0.0);
    summary.diagnostics["timing_ms"] = timing;
    if (auto w = writeStageFiles(outDir, kCandidatesFile, toJsonLines(out.candidates),
                                 summary.diagnostics);
        !w) {
        return stageError(summary.stage.c_str(), w.error());
    }
    summary.elapsedMs = timing["total"].get<double>() + msSince(writeStart);
    spdlog::info("Scout: {} merged -> {} candidates (K_A={}) in {:.1f} ms", out.mergedResults,
                 summary.outputCount, summary.limit, summary.elapsedMs);
    return summary;
}

Result<StageSummary> inspectOn(const config::PipelineConfig& config,
                               const PipelineBackends& backends, const ChunkCorpus& corpus,
                               const std::string& query, std::vector<Candidate> candidates,
                               size_t candidateSkips, const fs::path& outDir, json timing) {
    const auto start = Clock::now();
    InspectorStage stage(backends.interaction);
    auto result = stage.run(query, std::move(candidates), corpus, config);
    if (!result) {
        return result.error();
    }
    const auto& out = result.value();
    timing["scoring"] = out.scoringMs;

    StageSummary summary;
    summary.stage = "inspect";
    summary.inputCount = out.inputCount;
    summary.outputCount = out.candidates.size();
    summary.limit = config.widthB();
    summary.skippedLines = candidateSkips + corpus.loadStats().linesSkipped;
    summary.output = outDir / kRescoredFile;

    summary.diagnostics = json{{"stage", "inspect"},
                               {"input_candidates", out.inputCount},
                               {"duplicates_dropped", out.duplicatesDropped},
                               {"output_candidates", out.candidates.size()},
                               {"k", config.widthB()},
                               {"evidence", config.inspector.evidence},
                               {"skipped",
                                {{"candidates", candidateSkips},
                                 {"chunks", corpus.loadStats().linesSkipped}}}};
    timing["total"] = msSince(start) + timing.value("read", 0.0) + timing.value("load", 0.0);
    summary.diagnostics["timing_ms"] = timing;
    if (auto w = writeStageFiles(outDir, kRescoredFile, toJsonLines(out.candidates),
                                 summary.diagnostics);
        !w) {
        return stageError(summary.stage.c_str(), w.error());
    }
    summary.elapsedMs = timing["total"].get<double>();
    spdlog::info("Inspector: {} -> {} candidates (K_B={}) in {:.1f} ms", out.inputCount,
                 summary.outputCount, summary.limit, summary.elapsedMs);
    return summary;
}

Result<StageSummary> judgeOn(const config::PipelineConfig& config,
                             const PipelineBackends& backends, const ChunkCorpus& corpus,
                             const std::string& query, std::vector<RescoredCandidate> candidates,
                             size_t rescoredSkips, const NoteLinkTable* links,
                             ScoreCalibrator calibrator, const fs::path& outDir, json timing) {
    const auto start = Clock::now();
    JudgeStage stage(backends.pairwise, std::move(calibrator));
    auto result = stage.run(query, std::move(candidates), corpus, config, links);
    if (!result) {
        return result.error();
    }
    const auto& out = result.value();
    timing["scoring"] = out.scoringMs;

    const size_t linkSkips = links ? links->loadStats().linesSkipped : 0;
    StageSummary summary;
    summary.stage = "judge";
    summary.inputCount = out.inputCount;
    summary.outputCount = out.results.size();
    summary.limit = config.widthC();
    summary.skippedLines = rescoredSkips + corpus.loadStats().linesSkipped + linkSkips;
    summary.calibrated = out.calibrated;
    summary.output = outDir / kFinalFile;

    const auto& cal = stage.calibrator();
    summary.diagnostics =
        json{{"stage", "judge"},
             {"input_candidates", out.inputCount},
             {"duplicates_dropped", out.duplicatesDropped},
             {"output_candidates", out.results.size()},
             {"k", config.widthC()},
             {"patient_uid_attached", out.patientUidAttached},
             {"links_loaded", links != nullptr},
             {"calibrated", out.calibrated},
             {"calibration_method",
              config::PipelineConfig::calibrationMethodToString(config.calibration.method)},
             {"skipped",
              {{"rescored", rescoredSkips},
               {"chunks", corpus.loadStats().linesSkipped},
               {"links", linkSkips}}}};
    if (!cal.calibrated()) {
        summary.diagnostics["calibration_fallback"] = cal.reason();
        summary.diagnostics["raw_out_of_range"] = out.rawOutOfRange;
    }
    timing["total"] = msSince(start) + timing.value("read", 0.0) + timing.value("load", 0.0);
    summary.diagnostics["timing_ms"] = timing;
    if (auto w = writeStageFiles(outDir, kFinalFile, toJsonLines(out.results),
                                 summary.diagnostics);
        !w) {
        return stageError(summary.stage.c_str(), w.error());
    }
    summary.elapsedMs = timing["total"].get<double>();
    spdlog::info("Judge: {} -> {} results (K_C={}, calibrated={}) in {:.1f} ms",
                 out.inputCount, summary.outputCount, summary.limit, out.calibrated,
                 summary.elapsedMs);
    return summary;
}

Result<std::optional<NoteLinkTable>> loadLinks(const std::optional<fs::path>& linksPath) {
    if (!linksPath || linksPath->empty()) {
        return std::optional<NoteLinkTable>{};
    }
    auto links = NoteLinkTable::load(*linksPath);
    if (!links) {
        return links.error();
    }
    if (links.value().loadStats().linesSkipped > 0) {
        spdlog::warn("Note links {}: skipped {} line(s)", linksPath->string(),
                     links.value().loadStats().linesSkipped);
    }
    return std::optional<NoteLinkTable>{std::move(links).value()};
}

} // namespace

PipelineBackends withDefaultBackends(PipelineBackends backends, const ChunkCorpus& corpus,
                                     const config::PipelineConfig& config) {
    if (!backends.lexical) {
        backends.lexical =
            std::make_shared<Bm25Index>(corpus, Bm25Params{config.bm25.k1, config.bm25.b});
    }
    if (!backends.dense) {
        backends.dense = std::make_shared<HashedDenseIndex>(corpus, config.dense.dimensions);
    }
    if (!backends.interaction) {
        TokenInteractionScorer::Options options;
        options.maxTokens = config.inspector.maxTokens;
        options.evidenceLimit = config.inspector.evidence ? config.inspector.evidenceLimit : 0;
        backends.interaction = std::make_shared<TokenInteractionScorer>(options);
    }
    if (!backends.pairwise) {
        backends.pairwise = std::make_shared<TermPairwiseScorer>();
    }
    return backends;
}

Result<Pipeline> Pipeline::create(config::PipelineConfig config, PipelineBackends backends) {
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    return Pipeline(std::move(config), std::move(backends));
}

Result<StageSummary> Pipeline::runScout(const fs::path& corpusPath, const std::string& query,
                                        const fs::path& outDir) const {
    auto loaded = loadCorpus(corpusPath);
    if (!loaded) {
        return stageError("scout", loaded.error());
    }
    const auto& corpus = loaded.value().corpus;

    const auto indexStart = Clock::now();
    auto backends = withDefaultBackends(backends_, corpus, config_);
    json timing{{"load", loaded.value().ms}, {"index", msSince(indexStart)}};

    auto summary = scoutOn(config_, backends, corpus, query, outDir, std::move(timing));
    return summary;
}

Result<StageSummary> Pipeline::runInspect(const fs::path& candidatesPath,
                                          const fs::path& corpusPath, const std::string& query,
                                          const fs::path& outDir) const {
    const auto readStart = Clock::now();
    JsonlReadStats candidateStats;
    auto candidates = readRecords<Candidate>(candidatesPath, candidateFromJson, candidateStats);
    if (!candidates) {
        return stageError("inspect", candidates.error());
    }
    const double readMs = msSince(readStart);

    auto loaded = loadCorpus(corpusPath);
    if (!loaded) {
        return stageError("inspect", loaded.error());
    }
    const auto& corpus = loaded.value().corpus;
    auto backends = withDefaultBackends(backends_, corpus, config_);

    auto summary = inspectOn(config_, backends, corpus, query, std::move(candidates).value(),
                             candidateStats.linesSkipped, outDir,
                             json{{"read", readMs}, {"load", loaded.value().ms}});
    return summary;
}

Result<StageSummary> Pipeline::runJudge(const fs::path& rescoredPath, const fs::path& corpusPath,
                                        const std::string& query, const fs::path& outDir,
                                        const std::optional<fs::path>& linksPath) const {
    auto calibrator = loadCalibrator(config_.calibration.reference, config_.calibration.method);
    if (!calibrator) {
        return stageError("judge", calibrator.error());
    }

    const auto readStart = Clock::now();
    JsonlReadStats rescoredStats;
    auto rescored = readRecords<RescoredCandidate>(rescoredPath, rescoredFromJson, rescoredStats);
    if (!rescored) {
        return stageError("judge", rescored.error());
    }
    auto links = loadLinks(linksPath);
    if (!links) {
        return stageError("judge", links.error());
    }
    const double readMs = msSince(readStart);

    auto loaded = loadCorpus(corpusPath);
    if (!loaded) {
        return stageError("judge", loaded.error());
    }
    const auto& corpus = loaded.value().corpus;
    auto backends = withDefaultBackends(backends_, corpus, config_);

    const auto& table = links.value();
    auto summary = judgeOn(config_, backends, corpus, query, std::move(rescored).value(),
                           rescoredStats.linesSkipped, table ? &*table : nullptr,
                           std::move(calibrator).value(), outDir,
                           json{{"read", readMs}, {"load", loaded.value().ms}});
    return summary;
}

Result<std::vector<StageSummary>> Pipeline::runAll(const fs::path& corpusPath,
                                                   const std::string& query,
                                                   const fs::path& outDir,
                                                   const std::optional<fs::path>& linksPath) const {
    // Everything that can fail on input is read before the first stage runs
    auto calibrator = loadCalibrator(config_.calibration.reference, config_.calibration.method);
    if (!calibrator) {
        return stageError("judge", calibrator.error());
    }
    auto links = loadLinks(linksPath);
    if (!links) {
        return stageError("judge", links.error());
    }
    auto loaded = loadCorpus(corpusPath);
    if (!loaded) {
        return stageError("scout", loaded.error());
    }
    const auto& corpus = loaded.value().corpus;

    const auto indexStart = Clock::now();
    auto backends = withDefaultBackends(backends_, corpus, config_);
    const double indexMs = msSince(indexStart);

    std::vector<StageSummary> summaries;

    auto scout = scoutOn(config_, backends, corpus, query, outDir / "A",
                         json{{"load", loaded.value().ms}, {"index", indexMs}});
    if (!scout) {
        return scout.error();
    }
    summaries.push_back(scout.value());

    // Hand-off goes through the written file, exactly as separate stage runs would
    JsonlReadStats candidateStats;
    auto candidates =
        readRecords<Candidate>(outDir / "A" / kCandidatesFile, candidateFromJson, candidateStats);
    if (!candidates) {
        return stageError("inspect", candidates.error());
    }
    auto inspect = inspectOn(config_, backends, corpus, query, std::move(candidates).value(),
                             candidateStats.linesSkipped, outDir / "B", json::object());
    if (!inspect) {
        return inspect.error();
    }
    summaries.push_back(inspect.value());

    JsonlReadStats rescoredStats;
    auto rescored =
        readRecords<RescoredCandidate>(outDir / "B" / kRescoredFile, rescoredFromJson, rescoredStats);
    if (!rescored) {
        return stageError("judge", rescored.error());
    }
    const auto& table = links.value();
    auto judge = judgeOn(config_, backends, corpus, query, std::move(rescored).value(),
                         rescoredStats.linesSkipped, table ? &*table : nullptr,
                         std::move(calibrator).value(), outDir / "C", json::object());
    if (!judge) {
        return judge.error();
    }
    summaries.push_back(judge.value());
    return summaries;
}

} // namespace sieve::retrieve
