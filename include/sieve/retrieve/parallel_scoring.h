#pragma once

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cstddef>
#include <exception>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>
#include <sieve/core/types.h>

namespace sieve::retrieve {

/// Below this many items scoring stays on the calling thread
inline constexpr size_t kParallelScoringThreshold = 32;

namespace detail {

inline Error scoringFailure(std::string_view stage, std::string_view chunkId, size_t processed,
                            size_t total, const Error& cause) {
    return Error{cause.code,
                 fmt::format("{} stage failed on chunk '{}' after {}/{} candidates: {}", stage,
                             chunkId, processed, total, cause.message)};
}

} // namespace detail

/**
 * @brief Score every item independently, fanning out over a fixed worker pool
 *
 * `score` maps one item to Result<Out> and must only read shared state. Results are
 * collected in input order, so the caller's canonical sort sees the same input
 * regardless of worker count. An Error return or a thrown std::exception for any item
 * fails the whole batch; the error names the stage, the item's chunkId and how many
 * items had been scored. Nothing is retried or skipped.
 */
template <typename Out, typename Item, typename ScoreFn>
Result<std::vector<Out>> scoreAll(std::string_view stage, const std::vector<Item>& items,
                                  size_t workers, ScoreFn score) {
    const size_t total = items.size();
    std::vector<std::optional<Result<Out>>> slots(total);

    auto runOne = [&](size_t i) {
        try {
            slots[i].emplace(score(items[i]));
        } catch (const std::exception& e) {
            slots[i].emplace(Error{ErrorCode::ScorerFailure, e.what()});
        }
    };

    if (workers <= 1 || total < kParallelScoringThreshold) {
        for (size_t i = 0; i < total; ++i) {
            runOne(i);
            if (!slots[i]->has_value()) {
                return detail::scoringFailure(stage, items[i].chunkId, i, total,
                                              slots[i]->error());
            }
        }
    } else {
        boost::asio::thread_pool pool(std::min(workers, total));
        for (size_t i = 0; i < total; ++i) {
            boost::asio::post(pool, [&runOne, i]() { runOne(i); });
        }
        pool.join();
    }

    size_t processed = 0;
    for (const auto& slot : slots) {
        if (slot && slot->has_value())
            ++processed;
    }

    std::vector<Out> out;
    out.reserve(total);
    for (size_t i = 0; i < total; ++i) {
        if (!slots[i]->has_value()) {
            return detail::scoringFailure(stage, items[i].chunkId, processed, total,
                                          slots[i]->error());
        }
        out.push_back(std::move(*slots[i]).value());
    }
    return out;
}

} // namespace sieve::retrieve
