#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <sieve/config/config_helpers.h>
#include <sieve/config/pipeline_config.h>

#include "../../support/temp_dir_scope.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <string>

using Catch::Matchers::ContainsSubstring;
using sieve::ErrorCode;
using sieve::config::CalibrationMethod;
using sieve::config::PipelineConfig;
using sieve::test_support::ScopedEnv;
using sieve::test_support::TempDirScope;

TEST_CASE("Default pipeline config is valid", "[config][catch2]") {
    PipelineConfig cfg;
    CHECK(cfg.validate());
    CHECK(cfg.kA >= cfg.kB);
    CHECK(cfg.kB >= cfg.kC);
    CHECK(cfg.lexicalDepth() == static_cast<size_t>(cfg.kA));
    CHECK(cfg.workerCount() >= 1);
}

TEST_CASE("Funnel widths must narrow", "[config][catch2]") {
    PipelineConfig cfg;

    SECTION("K_A below K_B") {
        cfg.kA = 10;
        cfg.kB = 20;
        auto r = cfg.validate();
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::ConfigurationError);
        CHECK_THAT(r.error().message, ContainsSubstring("K_A (10) must be >= K_B (20)"));
    }
    SECTION("K_B below K_C") {
        cfg.kB = 5;
        cfg.kC = 6;
        auto r = cfg.validate();
        REQUIRE_FALSE(r);
        CHECK_THAT(r.error().message, ContainsSubstring("K_B"));
    }
    SECTION("non-positive K") {
        cfg.kC = 0;
        CHECK_FALSE(cfg.validate());
    }
    SECTION("equal widths are allowed") {
        cfg.kA = cfg.kB = cfg.kC = 3;
        CHECK(cfg.validate());
    }
}

TEST_CASE("Fusion weights and scoring parameters are range checked", "[config][catch2]") {
    PipelineConfig cfg;

    SECTION("weights off by more than epsilon") {
        cfg.fusion.weightLexical = 0.6;
        auto r = cfg.validate();
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::ConfigurationError);
        CHECK_THAT(r.error().message, ContainsSubstring("sum to 1.0"));
    }
    SECTION("weights within epsilon") {
        cfg.fusion.weightLexical = 0.5 + 1e-9;
        CHECK(cfg.validate());
    }
    SECTION("bm25 b outside [0, 1]") {
        cfg.bm25.b = 1.5;
        CHECK_FALSE(cfg.validate());
    }
    SECTION("zero dense dimensions") {
        cfg.dense.dimensions = 0;
        CHECK_FALSE(cfg.validate());
    }
}

TEST_CASE("Config values overlay the defaults", "[config][catch2]") {
    std::map<std::string, std::string> values{{"pipeline.k_a", "120"},
                                              {"pipeline.k_b", "+30"},
                                              {"pipeline.workers", "3"},
                                              {"fusion.weight_lexical", "0.3"},
                                              {"fusion.weight_dense", "0.7"},
                                              {"inspector.evidence", "off"},
                                              {"calibration.method", "Platt"},
                                              {"calibration.reference", "/data/ref.jsonl"},
                                              {"unknown.key", "whatever"}};

    auto cfg = sieve::config::applyConfigValues(PipelineConfig{}, values);
    REQUIRE(cfg);
    CHECK(cfg.value().kA == 120);
    CHECK(cfg.value().kB == 30);
    CHECK(cfg.value().kC == 10);
    CHECK(cfg.value().workerCount() == 3);
    CHECK(cfg.value().fusion.weightDense == 0.7);
    CHECK_FALSE(cfg.value().inspector.evidence);
    CHECK(cfg.value().calibration.method == CalibrationMethod::Platt);
    CHECK(cfg.value().calibration.reference == std::filesystem::path("/data/ref.jsonl"));
    CHECK(cfg.value().validate());
}

TEST_CASE("Unparseable config values name the key", "[config][catch2]") {
    SECTION("number") {
        auto cfg = sieve::config::applyConfigValues(PipelineConfig{}, {{"pipeline.k_c", "ten"}});
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error().code == ErrorCode::ConfigurationError);
        CHECK_THAT(cfg.error().message, ContainsSubstring("pipeline.k_c"));
    }
    SECTION("negative count") {
        auto cfg =
            sieve::config::applyConfigValues(PipelineConfig{}, {{"pipeline.workers", "-2"}});
        REQUIRE_FALSE(cfg);
    }
    SECTION("calibration method") {
        auto cfg = sieve::config::applyConfigValues(PipelineConfig{},
                                                    {{"calibration.method", "spline"}});
        REQUIRE_FALSE(cfg);
        CHECK_THAT(cfg.error().message, ContainsSubstring("isotonic or platt"));
    }
}

TEST_CASE("Pipeline config loads from a TOML file", "[config][catch2]") {
    auto tmp = TempDirScope::unique_under("sieve-config");
    auto file = tmp.write("config.toml", {"# funnel settings",
                                          "[pipeline]",
                                          "k_a = 80   # wide",
                                          "k_b = 20",
                                          "k_c = 5",
                                          "",
                                          "[bm25]",
                                          "k1 = 1.2",
                                          "",
                                          "[calibration]",
                                          "method = \"isotonic\""});

    auto cfg = sieve::config::loadPipelineConfig(file);
    REQUIRE(cfg);
    CHECK(cfg.value().kA == 80);
    CHECK(cfg.value().kB == 20);
    CHECK(cfg.value().kC == 5);
    CHECK(cfg.value().bm25.k1 == 1.2);
    CHECK(cfg.value().bm25.b == 0.4);
    CHECK(cfg.value().calibration.method == CalibrationMethod::Isotonic);

    auto missing = sieve::config::loadPipelineConfig(tmp.path() / "absent.toml");
    REQUIRE(missing);
    CHECK(missing.value().kA == PipelineConfig{}.kA);
}

TEST_CASE("Unreadable config file is an error, not defaults", "[config][catch2]") {
    namespace fs = std::filesystem;
    auto tmp = TempDirScope::unique_under("sieve-config-perms");
    auto file = tmp.write("config.toml", {"[pipeline]", "k_a = 80"});
    fs::permissions(file, fs::perms::none, fs::perm_options::replace);

    if (std::ifstream reader(file); reader.is_open()) {
        reader.close();
        fs::permissions(file, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace);
        SKIP("File permissions are not enforced for this user");
    }

    auto cfg = sieve::config::loadPipelineConfig(file);
    fs::permissions(file, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace);
    REQUIRE_FALSE(cfg);
    CHECK(cfg.error().code == ErrorCode::ConfigurationError);
    CHECK_THAT(cfg.error().message, ContainsSubstring(file.string()));
}

TEST_CASE("Config path resolution honours overrides", "[config][catch2]") {
    SECTION("explicit path wins") {
        ScopedEnv env("SIEVE_CONFIG", "/etc/sieve/from-env.toml");
        CHECK(sieve::config::get_config_path("/tmp/explicit.toml") ==
              std::filesystem::path("/tmp/explicit.toml"));
    }
    SECTION("environment variable") {
        ScopedEnv env("SIEVE_CONFIG", "/etc/sieve/from-env.toml");
        CHECK(sieve::config::get_config_path() ==
              std::filesystem::path("/etc/sieve/from-env.toml"));
    }
    SECTION("XDG config home") {
        ScopedEnv env("SIEVE_CONFIG", nullptr);
        ScopedEnv xdg("XDG_CONFIG_HOME", "/home/tester/.cfg");
        CHECK(sieve::config::get_config_path() ==
              std::filesystem::path("/home/tester/.cfg/sieve/config.toml"));
    }
}
