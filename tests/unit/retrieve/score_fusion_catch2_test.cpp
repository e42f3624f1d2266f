#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <sieve/retrieve/records.h>
#include <sieve/retrieve/score_fusion.h>

#include <string>
#include <vector>

using Catch::Approx;
using sieve::ErrorCode;
using sieve::retrieve::Candidate;
using sieve::retrieve::FusionWeights;
using sieve::retrieve::RankKey;

namespace {

Candidate makeCandidate(std::string id, double fusion) {
    Candidate c;
    c.chunkId = std::move(id);
    c.fusionScore = fusion;
    return c;
}

RankKey byFusion(const Candidate& c) {
    return RankKey{c.fusionScore, 0.0};
}

} // namespace

TEST_CASE("minMaxNormalize scales to the unit interval", "[retrieve][fusion][catch2]") {
    auto out = sieve::retrieve::minMaxNormalize({2.0, 4.0, 3.0});
    REQUIRE(out.size() == 3);
    CHECK(out[0] == Approx(0.0));
    CHECK(out[1] == Approx(1.0));
    CHECK(out[2] == Approx(0.5));
}

TEST_CASE("minMaxNormalize maps uniform sets to 1.0", "[retrieve][fusion][catch2]") {
    SECTION("single element") {
        auto out = sieve::retrieve::minMaxNormalize({0.37});
        REQUIRE(out.size() == 1);
        CHECK(out[0] == 1.0);
    }
    SECTION("all zeros") {
        auto out = sieve::retrieve::minMaxNormalize({0.0, 0.0, 0.0});
        CHECK(out == std::vector<double>{1.0, 1.0, 1.0});
    }
    SECTION("identical non-zero scores") {
        auto out = sieve::retrieve::minMaxNormalize({5.5, 5.5});
        CHECK(out == std::vector<double>{1.0, 1.0});
    }
    SECTION("empty input") {
        CHECK(sieve::retrieve::minMaxNormalize({}).empty());
    }
}

TEST_CASE("Fusion weights must sum to one", "[retrieve][fusion][catch2]") {
    CHECK(sieve::retrieve::validateFusionWeights(FusionWeights{0.5, 0.5}));
    CHECK(sieve::retrieve::validateFusionWeights(FusionWeights{0.3, 0.7 + 5e-7}));
    CHECK(sieve::retrieve::validateFusionWeights(FusionWeights{1.0, 0.0}));

    auto bad = sieve::retrieve::validateFusionWeights(FusionWeights{0.6, 0.6});
    REQUIRE_FALSE(bad);
    CHECK(bad.error().code == ErrorCode::ConfigurationError);

    CHECK_FALSE(sieve::retrieve::validateFusionWeights(FusionWeights{1.5, -0.5}));
}

TEST_CASE("fuseScores is a clamped weighted sum", "[retrieve][fusion][catch2]") {
    FusionWeights w{0.25, 0.75};
    CHECK(sieve::retrieve::fuseScores(w, 1.0, 0.0) == Approx(0.25));
    CHECK(sieve::retrieve::fuseScores(w, 0.0, 1.0) == Approx(0.75));
    CHECK(sieve::retrieve::fuseScores(w, 1.0, 1.0) == Approx(1.0));
    CHECK(sieve::retrieve::fuseScores(w, 0.0, 0.0) == 0.0);
}

TEST_CASE("rankAndTruncate orders by score then ascending id", "[retrieve][fusion][catch2]") {
    std::vector<Candidate> items{makeCandidate("c3", 0.5), makeCandidate("c1", 0.9),
                                 makeCandidate("c2", 0.5), makeCandidate("c0", 0.1)};

    sieve::retrieve::rankAndTruncate(items, 3, byFusion);

    REQUIRE(items.size() == 3);
    CHECK(items[0].chunkId == "c1");
    CHECK(items[1].chunkId == "c2");
    CHECK(items[2].chunkId == "c3");
    CHECK(sieve::retrieve::isCanonicallyRanked(items, byFusion));
}

TEST_CASE("rankAndTruncate result does not depend on input order", "[retrieve][fusion][catch2]") {
    std::vector<Candidate> a{makeCandidate("b", 0.4), makeCandidate("a", 0.4),
                             makeCandidate("c", 0.8)};
    std::vector<Candidate> b{makeCandidate("c", 0.8), makeCandidate("a", 0.4),
                             makeCandidate("b", 0.4)};

    sieve::retrieve::rankAndTruncate(a, 10, byFusion);
    sieve::retrieve::rankAndTruncate(b, 10, byFusion);

    REQUIRE(a.size() == b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        CHECK(a[i].chunkId == b[i].chunkId);
    }
}

TEST_CASE("Secondary key breaks primary ties before the id", "[retrieve][fusion][catch2]") {
    std::vector<Candidate> items{makeCandidate("a", 0.2), makeCandidate("b", 0.9)};
    items[0].lexicalScore = 0.5;
    items[1].lexicalScore = 0.5;

    sieve::retrieve::rankAndTruncate(items, 2, [](const Candidate& c) {
        return RankKey{c.lexicalScore, c.fusionScore};
    });
    CHECK(items[0].chunkId == "b");
    CHECK(items[1].chunkId == "a");
}

TEST_CASE("dropDuplicateIds keeps first occurrences", "[retrieve][fusion][catch2]") {
    std::vector<Candidate> items{makeCandidate("x", 0.1), makeCandidate("y", 0.2),
                                 makeCandidate("x", 0.9)};
    CHECK(sieve::retrieve::dropDuplicateIds(items) == 1);
    REQUIRE(items.size() == 2);
    CHECK(items[0].chunkId == "x");
    CHECK(items[0].fusionScore == 0.1);
    CHECK(items[1].chunkId == "y");
}
