#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

namespace mapreducer {

// Separator placed between items when a reduction group is joined.
inline constexpr const char* GROUP_SEPARATOR = "\n\n---\n\n";

// Position of one combine call within the reduction tree.
struct GroupInfo {
    std::size_t round{0};        // 1-based
    std::size_t index{0};        // 0-based, left to right
    std::size_t group_count{0};  // groups in this round
};

// Optional per-round callbacks.
struct ReduceObserver {
    // (round, group_count), before any group of the round is combined
    std::function<void(std::size_t, std::size_t)> round_started;
    // (round, outputs), after every group of the round succeeded
    std::function<void(std::size_t, std::size_t)> round_completed;
};

// Contiguous left-to-right slices of at most group_size items.
template <typename T>
std::vector<std::vector<T>> make_groups(const std::vector<T>& items, std::size_t group_size) {
    if (group_size == 0) {
        throw std::invalid_argument("group_size must be at least 1");
    }
    std::vector<std::vector<T>> groups;
    groups.reserve((items.size() + group_size - 1) / group_size);
    for (std::size_t begin = 0; begin < items.size(); begin += group_size) {
        std::size_t end = std::min(items.size(), begin + group_size);
        groups.emplace_back(items.begin() + begin, items.begin() + end);
    }
    return groups;
}

inline std::string join_group(const std::vector<std::string>& group) {
    std::string joined;
    for (std::size_t i = 0; i < group.size(); ++i) {
        if (i > 0) joined += GROUP_SEPARATOR;
        joined += group[i];
    }
    return joined;
}

// Tree reduction of `items` down to one value.
//
// Each round partitions the current items into groups of at most group_size,
// starts combine(group, info) for every group, then awaits the returned
// futures in group order. The outputs become the next round's items. A round
// always runs at least once, so a single item still passes through combine.
//
// group_size 1 with more than one item is treated as 2 so that every round
// shrinks the item count. If any group fails, the rest of its round is still
// awaited and the first failure (in group order) is rethrown.
template <typename T, typename Combine>
T hierarchical_reduce(std::vector<T> items,
                      Combine&& combine,
                      std::size_t group_size,
                      const ReduceObserver& observer = ReduceObserver{}) {
    if (items.empty()) {
        throw std::invalid_argument("hierarchical_reduce requires at least one item");
    }
    if (group_size == 0) {
        throw std::invalid_argument("group_size must be at least 1");
    }
    const std::size_t effective = items.size() > 1 ? std::max<std::size_t>(group_size, 2)
                                                   : group_size;

    for (std::size_t round = 1;; ++round) {
        auto groups = make_groups(items, effective);
        const std::size_t group_count = groups.size();
        if (observer.round_started) {
            observer.round_started(round, group_count);
        }

        std::vector<std::future<T>> pending;
        pending.reserve(group_count);
        for (std::size_t i = 0; i < group_count; ++i) {
            pending.push_back(combine(std::move(groups[i]), GroupInfo{round, i, group_count}));
        }

        std::vector<T> next;
        next.reserve(group_count);
        std::exception_ptr first_failure;
        for (auto& fut : pending) {
            try {
                next.push_back(fut.get());
            } catch (...) {
                // Held until the whole round has settled, then rethrown.
                if (!first_failure) {
                    first_failure = std::current_exception();
                }
            }
        }
        if (first_failure) {
            std::rethrow_exception(first_failure);
        }

        items = std::move(next);
        if (observer.round_completed) {
            observer.round_completed(round, items.size());
        }
        if (items.size() == 1) {
            return std::move(items.front());
        }
    }
}

} // namespace mapreducer
