#include <algorithm>
#include <cctype>
#include <iterator>
#include <unordered_set>
#include <sieve/retrieve/tokenizer.h>

namespace sieve::retrieve {

namespace {

constexpr size_t kMinContainmentLength = 3;
constexpr double kContainmentWeight = 0.9;
constexpr double kTrigramWeight = 0.8;
constexpr double kTrigramFloor = 0.4;

bool isTermByte(unsigned char c) {
    return c >= 0x80 || std::isalnum(c);
}

} // namespace

std::vector<std::string> tokenize(std::string_view text, size_t maxTokens) {
    std::vector<std::string> tokens;
    std::string current;

    auto flush = [&]() {
        if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    };

    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (isTermByte(c)) {
            current.push_back(c < 0x80 ? static_cast<char>(std::tolower(c)) : ch);
        } else {
            flush();
            if (maxTokens && tokens.size() >= maxTokens) {
                return tokens;
            }
        }
    }
    flush();

    if (maxTokens && tokens.size() > maxTokens) {
        tokens.resize(maxTokens);
    }
    return tokens;
}

std::vector<std::string> uniqueTerms(const std::vector<std::string>& tokens) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& t : tokens) {
        if (seen.insert(t).second) {
            out.push_back(t);
        }
    }
    return out;
}

std::vector<std::string> charTrigrams(std::string_view term) {
    std::string padded;
    padded.reserve(term.size() + 2);
    padded.push_back('^');
    padded.append(term);
    padded.push_back('$');

    std::vector<std::string> grams;
    if (padded.size() < 3) {
        return grams;
    }
    grams.reserve(padded.size() - 2);
    for (size_t i = 0; i + 3 <= padded.size(); ++i) {
        grams.emplace_back(padded.substr(i, 3));
    }
    std::sort(grams.begin(), grams.end());
    grams.erase(std::unique(grams.begin(), grams.end()), grams.end());
    return grams;
}

double termSimilarity(std::string_view a, std::string_view b) {
    if (a.empty() || b.empty()) {
        return 0.0;
    }
    if (a == b) {
        return 1.0;
    }

    const std::string_view& shorter = a.size() <= b.size() ? a : b;
    const std::string_view& longer = a.size() <= b.size() ? b : a;
    if (shorter.size() >= kMinContainmentLength && longer.find(shorter) != std::string_view::npos) {
        return kContainmentWeight * static_cast<double>(shorter.size()) /
               static_cast<double>(longer.size());
    }

    auto ga = charTrigrams(a);
    auto gb = charTrigrams(b);
    if (ga.empty() || gb.empty()) {
        return 0.0;
    }
    std::vector<std::string> shared;
    std::set_intersection(ga.begin(), ga.end(), gb.begin(), gb.end(), std::back_inserter(shared));
    const double dice =
        2.0 * static_cast<double>(shared.size()) / static_cast<double>(ga.size() + gb.size());
    return dice >= kTrigramFloor ? kTrigramWeight * dice : 0.0;
}

} // namespace sieve::retrieve
