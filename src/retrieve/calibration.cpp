#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>
#include <sieve/retrieve/calibration.h>

namespace sieve::retrieve {

namespace {

constexpr int kMaxNewtonIterations = 100;
constexpr double kNewtonTolerance = 1e-10;
constexpr double kRidge = 1e-9;

// log(1 + e^x) without overflow
double log1pExp(double x) {
    return x > 0.0 ? x + std::log1p(std::exp(-x)) : std::log1p(std::exp(x));
}

double sigmoid(double x) {
    if (x >= 0.0) {
        return 1.0 / (1.0 + std::exp(-x));
    }
    const double e = std::exp(x);
    return e / (1.0 + e);
}

bool parseLabel(const nlohmann::json& v, bool& out) {
    if (v.is_boolean()) {
        out = v.get<bool>();
        return true;
    }
    if (v.is_number()) {
        const double d = v.get<double>();
        if (d == 0.0 || d == 1.0) {
            out = d == 1.0;
            return true;
        }
    }
    return false;
}

} // namespace

Result<CalibrationSet> loadCalibrationSet(const std::filesystem::path& path) {
    CalibrationSet set;
    auto stats = readJsonl(path, [&set](const nlohmann::json& j, size_t) {
        if (!j.is_object() || !j.contains("score") || !j.contains("label"))
            return false;
        const auto& score = j.at("score");
        if (!score.is_number())
            return false;
        CalibrationSample sample;
        sample.score = score.get<double>();
        if (!std::isfinite(sample.score) || !parseLabel(j.at("label"), sample.relevant))
            return false;
        set.samples.push_back(sample);
        return true;
    });
    if (!stats) {
        return stats.error();
    }
    set.stats = stats.value();
    return set;
}

ScoreCalibrator ScoreCalibrator::identity(std::string reason) {
    ScoreCalibrator c;
    c.reason_ = std::move(reason);
    return c;
}

ScoreCalibrator ScoreCalibrator::fit(const std::vector<CalibrationSample>& samples,
                                     CalibrationMethod method) {
    auto degenerate = [method](std::string reason) {
        auto c = identity(std::move(reason));
        c.method_ = method;
        return c;
    };

    if (samples.empty()) {
        return degenerate("calibration reference set is empty");
    }

    const auto positives = static_cast<size_t>(
        std::count_if(samples.begin(), samples.end(),
                      [](const CalibrationSample& s) { return s.relevant; }));
    if (positives == 0 || positives == samples.size()) {
        return degenerate("calibration reference set has a single class");
    }

    auto sorted = samples;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const CalibrationSample& a, const CalibrationSample& b) {
                         return a.score < b.score;
                     });
    if (sorted.front().score == sorted.back().score) {
        return degenerate("calibration reference set has a single distinct score");
    }

    ScoreCalibrator c = method == CalibrationMethod::Platt ? fitPlatt(sorted)
                                                           : fitIsotonic(sorted);
    c.method_ = method;
    return c;
}

ScoreCalibrator ScoreCalibrator::fitIsotonic(const std::vector<CalibrationSample>& sorted) {
    struct Block {
        double lo;
        double hi;
        double sum;
        double weight;
        double mean() const { return sum / weight; }
    };

    std::vector<Block> blocks;
    for (const auto& s : sorted) {
        const double y = s.relevant ? 1.0 : 0.0;
        if (!blocks.empty() && blocks.back().hi == s.score) {
            blocks.back().sum += y;
            blocks.back().weight += 1.0;
        } else {
            blocks.push_back(Block{s.score, s.score, y, 1.0});
        }
        // Pool adjacent violators
        while (blocks.size() > 1 && blocks[blocks.size() - 2].mean() > blocks.back().mean()) {
            Block last = blocks.back();
            blocks.pop_back();
            auto& prev = blocks.back();
            prev.hi = last.hi;
            prev.sum += last.sum;
            prev.weight += last.weight;
        }
    }

    ScoreCalibrator c;
    c.calibrated_ = true;
    for (const auto& b : blocks) {
        const double p = std::clamp(b.mean(), 0.0, 1.0);
        c.knots_.push_back(Knot{b.lo, p});
        if (b.hi > b.lo) {
            c.knots_.push_back(Knot{b.hi, p});
        }
    }
    spdlog::debug("Isotonic calibration: {} samples pooled into {} blocks", sorted.size(),
                  blocks.size());
    return c;
}

ScoreCalibrator ScoreCalibrator::fitPlatt(const std::vector<CalibrationSample>& sorted) {
    size_t positives = 0;
    for (const auto& s : sorted)
        positives += s.relevant ? 1 : 0;
    const size_t negatives = sorted.size() - positives;

    // Smoothed targets keep the fit finite on separable data
    const double hiTarget = (static_cast<double>(positives) + 1.0) / (positives + 2.0);
    const double loTarget = 1.0 / (static_cast<double>(negatives) + 2.0);

    auto loss = [&](double a, double b) {
        double total = 0.0;
        for (const auto& s : sorted) {
            const double f = a * s.score + b;
            const double t = s.relevant ? hiTarget : loTarget;
            total += t * log1pExp(-f) + (1.0 - t) * log1pExp(f);
        }
        return total;
    };

    double a = 0.0;
    double b = std::log((static_cast<double>(positives) + 1.0) / (negatives + 1.0));
    double current = loss(a, b);

    for (int iter = 0; iter < kMaxNewtonIterations; ++iter) {
        double ga = 0.0, gb = 0.0, haa = kRidge, hab = 0.0, hbb = kRidge;
        for (const auto& s : sorted) {
            const double p = sigmoid(a * s.score + b);
            const double t = s.relevant ? hiTarget : loTarget;
            const double d = p - t;
            const double w = p * (1.0 - p);
            ga += d * s.score;
            gb += d;
            haa += w * s.score * s.score;
            hab += w * s.score;
            hbb += w;
        }
        if (std::fabs(ga) < kNewtonTolerance && std::fabs(gb) < kNewtonTolerance) {
            break;
        }

        const double det = haa * hbb - hab * hab;
        if (!(det > 0.0)) {
            break;
        }
        const double da = -(hbb * ga - hab * gb) / det;
        const double db = -(haa * gb - hab * ga) / det;

        // Backtracking line search
        double step = 1.0;
        bool improved = false;
        while (step >= 1e-10) {
            const double na = a + step * da;
            const double nb = b + step * db;
            const double next = loss(na, nb);
            if (next < current + 1e-4 * step * (ga * da + gb * db)) {
                a = na;
                b = nb;
                current = next;
                improved = true;
                break;
            }
            step *= 0.5;
        }
        if (!improved) {
            break;
        }
    }

    if (!std::isfinite(a) || !std::isfinite(b) || !(a > 0.0)) {
        return identity("Platt fit is not increasing in the raw score");
    }

    ScoreCalibrator c;
    c.calibrated_ = true;
    c.slope_ = a;
    c.intercept_ = b;
    spdlog::debug("Platt calibration: a={:.6f} b={:.6f} over {} samples", a, b, sorted.size());
    return c;
}

double ScoreCalibrator::apply(double raw) const {
    if (!calibrated_) {
        return std::clamp(raw, 0.0, 1.0);
    }

    if (method_ == CalibrationMethod::Platt) {
        return std::clamp(sigmoid(slope_ * raw + intercept_), 0.0, 1.0);
    }

    if (knots_.empty()) {
        return std::clamp(raw, 0.0, 1.0);
    }
    if (raw <= knots_.front().score)
        return knots_.front().probability;
    if (raw >= knots_.back().score)
        return knots_.back().probability;

    // First knot strictly above raw; its predecessor is at or below
    auto hi = std::upper_bound(knots_.begin(), knots_.end(), raw,
                               [](double v, const Knot& k) { return v < k.score; });
    auto lo = hi - 1;
    const double span = hi->score - lo->score;
    if (span <= 0.0) {
        return hi->probability;
    }
    const double t = (raw - lo->score) / span;
    return std::clamp(lo->probability + t * (hi->probability - lo->probability), 0.0, 1.0);
}

Result<ScoreCalibrator> loadCalibrator(const std::filesystem::path& reference,
                                       CalibrationMethod method) {
    if (reference.empty()) {
        return ScoreCalibrator::identity("no calibration reference configured");
    }

    auto set = loadCalibrationSet(reference);
    if (!set) {
        return Error{set.error().code,
                     "Failed to read calibration reference: " + set.error().message};
    }
    if (set.value().stats.linesSkipped > 0) {
        spdlog::warn("Calibration reference {}: skipped {} malformed line(s)",
                     reference.string(), set.value().stats.linesSkipped);
    }

    auto calibrator = ScoreCalibrator::fit(set.value().samples, method);
    if (!calibrator.calibrated()) {
        spdlog::warn("Calibration degenerate ({}); using identity mapping", calibrator.reason());
    } else {
        spdlog::info("Calibrated with {} over {} reference samples",
                     config::PipelineConfig::calibrationMethodToString(method),
                     set.value().samples.size());
    }
    return calibrator;
}

void enforceMonotonic(const std::vector<double>& raw, std::vector<double>& calibrated) {
    const size_t n = std::min(raw.size(), calibrated.size());
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&raw](size_t a, size_t b) { return raw[a] < raw[b]; });

    double running = 0.0;
    bool first = true;
    for (size_t i = 0; i < n;) {
        // Equal raw scores share one calibrated value
        size_t j = i;
        double groupMax = first ? calibrated[order[i]] : running;
        while (j < n && raw[order[j]] == raw[order[i]]) {
            groupMax = std::max(groupMax, calibrated[order[j]]);
            ++j;
        }
        for (size_t k = i; k < j; ++k) {
            calibrated[order[k]] = groupMax;
        }
        running = groupMax;
        first = false;
        i = j;
    }
}

} // namespace sieve::retrieve
