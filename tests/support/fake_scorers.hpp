#pragma once

#include <atomic>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <sieve/retrieve/scorers.h>

namespace sieve::test_support {

// Index returning a fixed hit list regardless of the query. Safe to query from
// several threads, as Scout does when it runs both retrievers at once.
class FixedIndex : public retrieve::ILexicalIndex, public retrieve::IDenseIndex {
public:
    explicit FixedIndex(std::vector<retrieve::ScoredChunk> hits) : hits_(std::move(hits)) {}

    Result<std::vector<retrieve::ScoredChunk>> search(const std::string&, size_t limit) override {
        ++calls;
        auto hits = hits_;
        if (hits.size() > limit)
            hits.resize(limit);
        return hits;
    }

    std::atomic<int> calls{0};

private:
    std::vector<retrieve::ScoredChunk> hits_;
};

// Scores chunks by exact text lookup; unknown text scores 0, "boom" throws.
class TableInteractionScorer : public retrieve::IInteractionScorer {
public:
    explicit TableInteractionScorer(std::map<std::string, double> byText,
                                    bool withEvidence = true)
        : byText_(std::move(byText)), withEvidence_(withEvidence) {}

    Result<retrieve::InteractionScore> score(const std::string&,
                                             const std::string& text) override {
        if (text == "boom")
            throw std::runtime_error("interaction model crashed");
        retrieve::InteractionScore s;
        auto it = byText_.find(text);
        s.score = it == byText_.end() ? 0.0 : it->second;
        if (withEvidence_) {
            s.evidence.push_back(retrieve::EvidenceToken{"low", 0.1, 3});
            s.evidence.push_back(retrieve::EvidenceToken{"high", 0.9, 1});
        }
        return s;
    }

private:
    std::map<std::string, double> byText_;
    bool withEvidence_;
};

// Pairwise scorer by text lookup; "fail" returns an error.
class TablePairwiseScorer : public retrieve::IPairwiseScorer {
public:
    explicit TablePairwiseScorer(std::map<std::string, double> byText)
        : byText_(std::move(byText)) {}

    Result<double> score(const std::string&, const std::string& text) override {
        if (text == "fail")
            return Error{ErrorCode::InternalError, "pairwise backend unavailable"};
        auto it = byText_.find(text);
        return it == byText_.end() ? 0.0 : it->second;
    }

private:
    std::map<std::string, double> byText_;
};

} // namespace sieve::test_support
