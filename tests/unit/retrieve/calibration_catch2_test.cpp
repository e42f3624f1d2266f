#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <sieve/retrieve/calibration.h>

#include "../../support/temp_dir_scope.hpp"

#include <vector>

using Catch::Approx;
using sieve::retrieve::CalibrationMethod;
using sieve::retrieve::CalibrationSample;
using sieve::retrieve::ScoreCalibrator;
using sieve::test_support::TempDirScope;

namespace {

std::vector<CalibrationSample> overlappingReference() {
    // Relevance rises with score but the classes overlap
    return {{0.05, false}, {0.10, false}, {0.20, true},  {0.25, false}, {0.30, false},
            {0.40, false}, {0.45, true},  {0.50, false}, {0.60, true},  {0.65, true},
            {0.70, false}, {0.80, true},  {0.85, true},  {0.90, true},  {0.95, true}};
}

void checkMonotonicOnGrid(const ScoreCalibrator& cal) {
    double previous = -1.0;
    for (int i = -10; i <= 110; ++i) {
        const double raw = i / 100.0;
        const double p = cal.apply(raw);
        CHECK(p >= 0.0);
        CHECK(p <= 1.0);
        CHECK(p >= previous);
        previous = p;
    }
}

} // namespace

TEST_CASE("Isotonic calibration is monotonic and pools violators",
          "[retrieve][calibration][catch2]") {
    auto cal = ScoreCalibrator::fit(overlappingReference(), CalibrationMethod::Isotonic);
    REQUIRE(cal.calibrated());
    CHECK(cal.method() == CalibrationMethod::Isotonic);

    const auto& knots = cal.knots();
    REQUIRE(knots.size() >= 2);
    for (size_t i = 1; i < knots.size(); ++i) {
        CHECK(knots[i].score >= knots[i - 1].score);
        CHECK(knots[i].probability >= knots[i - 1].probability);
    }
    CHECK(cal.apply(0.0) == Approx(0.0));
    CHECK(cal.apply(1.0) == Approx(1.0));
    checkMonotonicOnGrid(cal);
}

TEST_CASE("Isotonic calibration interpolates between block edges",
          "[retrieve][calibration][catch2]") {
    std::vector<CalibrationSample> ref{{0.0, false}, {1.0, true}};
    auto cal = ScoreCalibrator::fit(ref, CalibrationMethod::Isotonic);
    REQUIRE(cal.calibrated());
    CHECK(cal.apply(0.25) == Approx(0.25));
    CHECK(cal.apply(0.5) == Approx(0.5));
    CHECK(cal.apply(-3.0) == 0.0);
    CHECK(cal.apply(7.0) == 1.0);
}

TEST_CASE("Platt calibration fits an increasing sigmoid", "[retrieve][calibration][catch2]") {
    auto cal = ScoreCalibrator::fit(overlappingReference(), CalibrationMethod::Platt);
    REQUIRE(cal.calibrated());
    CHECK(cal.method() == CalibrationMethod::Platt);
    CHECK(cal.slope() > 0.0);
    CHECK(cal.apply(0.9) > cal.apply(0.1));
    CHECK(cal.apply(0.95) > 0.5);
    CHECK(cal.apply(0.05) < 0.5);
    checkMonotonicOnGrid(cal);
}

TEST_CASE("Degenerate reference sets fall back to identity", "[retrieve][calibration][catch2]") {
    SECTION("single class") {
        std::vector<CalibrationSample> ref{{0.2, true}, {0.8, true}};
        auto cal = ScoreCalibrator::fit(ref, CalibrationMethod::Isotonic);
        CHECK_FALSE(cal.calibrated());
        CHECK_FALSE(cal.reason().empty());
        CHECK(cal.apply(0.3) == 0.3);
    }
    SECTION("empty") {
        auto cal = ScoreCalibrator::fit({}, CalibrationMethod::Platt);
        CHECK_FALSE(cal.calibrated());
        CHECK(cal.apply(1.7) == 1.0);
        CHECK(cal.apply(-0.2) == 0.0);
    }
    SECTION("decreasing relationship rejected by Platt") {
        std::vector<CalibrationSample> ref{{0.1, true}, {0.2, true}, {0.8, false}, {0.9, false}};
        auto cal = ScoreCalibrator::fit(ref, CalibrationMethod::Platt);
        CHECK_FALSE(cal.calibrated());
        CHECK(cal.apply(0.4) == 0.4);
    }
    SECTION("no reference configured") {
        auto cal = sieve::retrieve::loadCalibrator({}, CalibrationMethod::Isotonic);
        REQUIRE(cal);
        CHECK_FALSE(cal.value().calibrated());
    }
}

TEST_CASE("Calibration reference sets load from JSONL", "[retrieve][calibration][catch2]") {
    auto tmp = TempDirScope::unique_under("sieve-calibration");
    auto file = tmp.write("reference.jsonl", {R"({"score":0.1,"label":0})",
                                              R"({"score":0.9,"label":true})",
                                              R"({"score":0.5,"label":2})",
                                              R"({"score":"x","label":1})",
                                              R"({"label":1})"});

    auto set = sieve::retrieve::loadCalibrationSet(file);
    REQUIRE(set);
    REQUIRE(set.value().samples.size() == 2);
    CHECK(set.value().stats.linesSkipped == 3);
    CHECK_FALSE(set.value().samples[0].relevant);
    CHECK(set.value().samples[1].relevant);

    auto cal = sieve::retrieve::loadCalibrator(file, CalibrationMethod::Isotonic);
    REQUIRE(cal);
    CHECK(cal.value().calibrated());

    auto missing =
        sieve::retrieve::loadCalibrator(tmp.path() / "absent.jsonl", CalibrationMethod::Isotonic);
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == sieve::ErrorCode::FileNotFound);
}

TEST_CASE("enforceMonotonic repairs inverted calibrated values",
          "[retrieve][calibration][catch2]") {
    std::vector<double> raw{0.9, 0.1, 0.5, 0.5};
    std::vector<double> calibrated{0.4, 0.3, 0.6, 0.2};

    sieve::retrieve::enforceMonotonic(raw, calibrated);

    // Ascending raw order: 0.1 -> 0.3, 0.5/0.5 -> max(0.6, 0.2), 0.9 -> max(0.6, 0.4)
    CHECK(calibrated[1] == 0.3);
    CHECK(calibrated[2] == 0.6);
    CHECK(calibrated[3] == 0.6);
    CHECK(calibrated[0] == 0.6);
}
