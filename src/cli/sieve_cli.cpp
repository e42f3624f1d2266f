#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sieve/cli/command_registry.h>
#include <sieve/cli/error_hints.h>
#include <sieve/cli/sieve_cli.h>
#include <sieve/config/config_helpers.h>
#include <sieve/version.hpp>

namespace sieve::cli {

namespace fs = std::filesystem;

namespace {

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

} // namespace

SieveCli::SieveCli() {
    // Set a conservative default; finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("Clinical chunk ranking funnel: scout, inspect, judge",
                                      "sieve");
    app_->set_version_flag("--version", SIEVE_VERSION_STRING);
    app_->require_subcommand(1);
    // Global options are accepted after the subcommand too
    app_->fallthrough();

    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");
    app_->add_option("--config", configPath_, "Config file (default: $SIEVE_CONFIG, then "
                                              "~/.config/sieve/config.toml)")
        ->type_name("PATH");

    auto& o = overrides_;
    o.kAOpt = app_->add_option("--k-a", o.kA, "Scout output width (K_A)");
    o.kBOpt = app_->add_option("--k-b", o.kB, "Inspector output width (K_B)");
    o.kCOpt = app_->add_option("--k-c", o.kC, "Judge output width (K_C)");
    o.k1Opt = app_->add_option("--k1", o.k1, "BM25 term frequency saturation");
    o.bOpt = app_->add_option("--b", o.b, "BM25 length normalization");
    o.weightLexicalOpt = app_->add_option("--w-lexical", o.weightLexical, "Lexical fusion weight");
    o.weightDenseOpt = app_->add_option("--w-dense", o.weightDense, "Dense fusion weight");
    o.workersOpt =
        app_->add_option("--workers", o.workers, "Scoring worker threads (0 = hardware)");
    o.calibrationOpt = app_->add_option("--calibration", o.calibrationReference,
                                        "Calibration reference set ({score,label} JSONL)")
                           ->type_name("PATH");
    o.calibrationMethodOpt =
        app_->add_option("--calibration-method", o.calibrationMethod, "isotonic or platt");
}

SieveCli::~SieveCli() = default;

void SieveCli::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void SieveCli::setPendingCommand(ICommand* cmd) {
    pendingCommand_ = cmd;
}

void SieveCli::registerBuiltinCommands() {
    CommandRegistry::registerAllCommands(this);
}

void SieveCli::applyLogLevel() const {
    // Precedence: env SIEVE_LOG_LEVEL > --verbose > default (warn)
    if (const char* envLvl = std::getenv("SIEVE_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
        spdlog::warn("Ignoring unknown SIEVE_LOG_LEVEL '{}'", envLvl);
    }
    spdlog::set_level(verbose_ ? spdlog::level::debug : spdlog::level::warn);
}

int SieveCli::run(int argc, char* argv[]) {
    try {
        registerBuiltinCommands();
        app_->parse(argc, argv);

        // Apply log level after parsing flags (avoid CLI11 Option::callback dependency)
        applyLogLevel();

        if (pendingCommand_) {
            auto result = pendingCommand_->execute();
            if (!result) {
                reportFailure(pendingCommand_->getName(), result.error());
                return 1;
            }
        }
        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

Result<config::PipelineConfig> SieveCli::applyOverrides(config::PipelineConfig cfg) const {
    const auto& o = overrides_;
    if (o.kAOpt->count())
        cfg.kA = o.kA;
    if (o.kBOpt->count())
        cfg.kB = o.kB;
    if (o.kCOpt->count())
        cfg.kC = o.kC;
    if (o.k1Opt->count())
        cfg.bm25.k1 = o.k1;
    if (o.bOpt->count())
        cfg.bm25.b = o.b;
    if (o.weightLexicalOpt->count())
        cfg.fusion.weightLexical = o.weightLexical;
    if (o.weightDenseOpt->count())
        cfg.fusion.weightDense = o.weightDense;
    if (o.workersOpt->count())
        cfg.workers = o.workers;
    if (o.calibrationOpt->count())
        cfg.calibration.reference = config::expand_tilde(o.calibrationReference);
    if (o.calibrationMethodOpt->count()) {
        auto method = config::PipelineConfig::parseCalibrationMethod(o.calibrationMethod);
        if (!method) {
            return Error{ErrorCode::ConfigurationError,
                         "Unknown calibration method '" + o.calibrationMethod +
                             "' (expected isotonic or platt)"};
        }
        cfg.calibration.method = *method;
    }
    return cfg;
}

Result<config::PipelineConfig> SieveCli::resolveConfig() const {
    const fs::path path = config::get_config_path(configPath_);
    if (!configPath_.empty()) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return Error{ErrorCode::ConfigurationError,
                         "Config file not found: " + path.string()};
        }
    }

    auto loaded = config::loadPipelineConfig(path);
    if (!loaded) {
        return loaded.error();
    }
    auto cfg = applyOverrides(std::move(loaded).value());
    if (!cfg) {
        return cfg.error();
    }
    if (auto valid = cfg.value().validate(); !valid) {
        return valid.error();
    }
    spdlog::debug("Config: K_A={} K_B={} K_C={} k1={} b={} weights={}/{} workers={}",
                  cfg.value().kA, cfg.value().kB, cfg.value().kC, cfg.value().bm25.k1,
                  cfg.value().bm25.b, cfg.value().fusion.weightLexical,
                  cfg.value().fusion.weightDense, cfg.value().workerCount());
    return cfg;
}

void SieveCli::printSummary(const retrieve::StageSummary& summary) const {
    std::cout << "[OK] " << summary.stage << ": " << summary.inputCount << " -> "
              << summary.outputCount << " (K=" << summary.limit << ") in "
              << fmt::format("{:.1f}", summary.elapsedMs) << " ms -> "
              << summary.output.string();
    if (summary.calibrated && !*summary.calibrated) {
        std::cout << " [uncalibrated]";
    }
    std::cout << "\n";
    if (summary.skippedLines > 0) {
        std::cout << "  [WARN] skipped " << summary.skippedLines
                  << " malformed input line(s); see diagnostics.json\n";
    }
}

void SieveCli::reportFailure(const std::string& command, const Error& error) const {
    spdlog::error("{} failed: {}", command, error.message);
    std::cerr << "[FAIL] " << formatErrorWithHint(error.code, error.message, command) << "\n";
}

} // namespace sieve::cli
