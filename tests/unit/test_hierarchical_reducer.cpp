#include <gtest/gtest.h>
#include <mapreducer/mapreducer.hpp>

#include <future>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace mapreducer;
using namespace std::chrono_literals;

// ===========================================================================
// Helpers
// ===========================================================================

template <typename T>
static std::future<T> ready(T value) {
    std::promise<T> p;
    p.set_value(std::move(value));
    return p.get_future();
}

static std::vector<std::string> letters(std::size_t n) {
    std::vector<std::string> items;
    for (std::size_t i = 0; i < n; ++i) {
        items.push_back(std::string(1, static_cast<char>('a' + i % 26)));
    }
    return items;
}

// Records every combine call, grouped by round
struct CallLog {
    std::mutex mutex;
    std::map<std::size_t, std::vector<std::size_t>> group_sizes_by_round;

    std::size_t total_calls() {
        std::lock_guard<std::mutex> lock(mutex);
        std::size_t n = 0;
        for (auto& [_, sizes] : group_sizes_by_round) n += sizes.size();
        return n;
    }
};

static auto concat_combine(CallLog& log) {
    return [&log](std::vector<std::string> group, GroupInfo info) {
        {
            std::lock_guard<std::mutex> lock(log.mutex);
            log.group_sizes_by_round[info.round].push_back(group.size());
        }
        std::string out;
        for (auto& s : group) out += s;
        return ready(out);
    };
}

static std::size_t expected_rounds(std::size_t n, std::size_t g) {
    std::size_t rounds = 0;
    do {
        n = (n + g - 1) / g;
        ++rounds;
    } while (n > 1);
    return rounds;
}

// ===========================================================================
// Grouping helpers
// ===========================================================================

TEST(HierarchicalReducerTest, MakeGroups_ContiguousLeftToRight) {
    auto groups = make_groups(letters(5), 2);
    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0], (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(groups[1], (std::vector<std::string>{"c", "d"}));
    EXPECT_EQ(groups[2], (std::vector<std::string>{"e"}));
}

TEST(HierarchicalReducerTest, JoinGroup_UsesSeparator) {
    EXPECT_EQ(join_group({"one", "two"}), "one\n\n---\n\ntwo");
    EXPECT_EQ(join_group({"solo"}), "solo");
}

// ===========================================================================
// Reduction shape
// ===========================================================================

TEST(HierarchicalReducerTest, SingleItemStillCombinedOnce) {
    CallLog log;
    auto result = hierarchical_reduce(letters(1), concat_combine(log), 2);
    EXPECT_EQ(result, "a");
    EXPECT_EQ(log.total_calls(), 1u);
}

TEST(HierarchicalReducerTest, ItemsWithinGroupSize_OneCallWithAllItems) {
    CallLog log;
    auto result = hierarchical_reduce(letters(3), concat_combine(log), 5);
    EXPECT_EQ(result, "abc");
    ASSERT_EQ(log.group_sizes_by_round.size(), 1u);
    EXPECT_EQ(log.group_sizes_by_round[1], (std::vector<std::size_t>{3}));
}

TEST(HierarchicalReducerTest, FiveItemsGroupTwo_ThreeRounds) {
    CallLog log;
    auto result = hierarchical_reduce(letters(5), concat_combine(log), 2);

    EXPECT_EQ(result, "abcde");
    ASSERT_EQ(log.group_sizes_by_round.size(), 3u);
    EXPECT_EQ(log.group_sizes_by_round[1], (std::vector<std::size_t>{2, 2, 1}));
    EXPECT_EQ(log.group_sizes_by_round[2], (std::vector<std::size_t>{2, 1}));
    EXPECT_EQ(log.group_sizes_by_round[3], (std::vector<std::size_t>{2}));
    EXPECT_EQ(log.total_calls(), 6u);
}

TEST(HierarchicalReducerTest, FirstRoundHasCeilNOverGCalls) {
    for (std::size_t g = 2; g <= 5; ++g) {
        for (std::size_t n = g + 1; n <= 30; ++n) {
            CallLog log;
            hierarchical_reduce(letters(n), concat_combine(log), g);
            EXPECT_EQ(log.group_sizes_by_round[1].size(), (n + g - 1) / g)
                << "n=" << n << " g=" << g;
        }
    }
}

TEST(HierarchicalReducerTest, RoundCountIsCeilLogGN) {
    for (std::size_t g = 2; g <= 5; ++g) {
        for (std::size_t n = 2; n <= 40; ++n) {
            CallLog log;
            hierarchical_reduce(letters(n), concat_combine(log), g);
            EXPECT_EQ(log.group_sizes_by_round.size(), expected_rounds(n, g))
                << "n=" << n << " g=" << g;
        }
    }
}

TEST(HierarchicalReducerTest, GroupSizeOneCollapsesPairwise) {
    CallLog log;
    auto result = hierarchical_reduce(letters(4), concat_combine(log), 1);
    EXPECT_EQ(result, "abcd");
    EXPECT_EQ(log.group_sizes_by_round[1], (std::vector<std::size_t>{2, 2}));
    EXPECT_EQ(log.group_sizes_by_round[2], (std::vector<std::size_t>{2}));
}

TEST(HierarchicalReducerTest, DeterministicCombineIsIdempotent) {
    CallLog first_log;
    CallLog second_log;
    auto first = hierarchical_reduce(letters(11), concat_combine(first_log), 3);
    auto second = hierarchical_reduce(letters(11), concat_combine(second_log), 3);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first_log.group_sizes_by_round, second_log.group_sizes_by_round);
}

TEST(HierarchicalReducerTest, OrderPreservedWithAsyncCombine) {
    // Later groups finish first; outputs must still follow group order.
    auto combine = [](std::vector<std::string> group, GroupInfo info) {
        return std::async(std::launch::async, [group = std::move(group), info] {
            std::this_thread::sleep_for(std::chrono::milliseconds(5 * (info.group_count - info.index)));
            std::string out;
            for (auto& s : group) out += s;
            return out;
        });
    };
    EXPECT_EQ(hierarchical_reduce(letters(7), combine, 2), "abcdefg");
}

TEST(HierarchicalReducerTest, ObserverSeesEveryRound) {
    CallLog log;
    std::vector<std::pair<std::size_t, std::size_t>> started;
    std::vector<std::pair<std::size_t, std::size_t>> completed;

    ReduceObserver observer;
    observer.round_started = [&](std::size_t r, std::size_t groups) { started.emplace_back(r, groups); };
    observer.round_completed = [&](std::size_t r, std::size_t outputs) { completed.emplace_back(r, outputs); };

    hierarchical_reduce(letters(5), concat_combine(log), 2, observer);

    using P = std::pair<std::size_t, std::size_t>;
    EXPECT_EQ(started, (std::vector<P>{{1, 3}, {2, 2}, {3, 1}}));
    EXPECT_EQ(completed, (std::vector<P>{{1, 3}, {2, 2}, {3, 1}}));
}

// ===========================================================================
// Failures and argument checks
// ===========================================================================

TEST(HierarchicalReducerTest, FailureSettlesRoundThenRethrowsFirst) {
    std::mutex m;
    std::vector<std::size_t> invoked;

    auto combine = [&](std::vector<std::string> group, GroupInfo info) -> std::future<std::string> {
        {
            std::lock_guard<std::mutex> lock(m);
            invoked.push_back(info.index);
        }
        std::promise<std::string> p;
        if (info.index == 1) {
            p.set_exception(std::make_exception_ptr(std::runtime_error("group 1 failed")));
        } else if (info.index == 2) {
            p.set_exception(std::make_exception_ptr(std::runtime_error("group 2 failed")));
        } else {
            p.set_value(group.front());
        }
        return p.get_future();
    };

    try {
        hierarchical_reduce(letters(6), combine, 2);
        FAIL() << "Expected the first group failure";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "group 1 failed");
    }
    // All three groups of round 1 ran, nothing from round 2
    EXPECT_EQ(invoked, (std::vector<std::size_t>{0, 1, 2}));
}

TEST(HierarchicalReducerTest, EmptyInputThrows) {
    CallLog log;
    EXPECT_THROW(hierarchical_reduce(std::vector<std::string>{}, concat_combine(log), 2),
                 std::invalid_argument);
}

TEST(HierarchicalReducerTest, ZeroGroupSizeThrows) {
    CallLog log;
    EXPECT_THROW(hierarchical_reduce(letters(3), concat_combine(log), 0), std::invalid_argument);
    EXPECT_THROW(make_groups(letters(3), 0), std::invalid_argument);
}

TEST(HierarchicalReducerTest, WorksForNonStringItems) {
    auto sum = [](std::vector<int> group, GroupInfo) {
        int total = 0;
        for (int v : group) total += v;
        return ready(total);
    };
    EXPECT_EQ(hierarchical_reduce(std::vector<int>{1, 2, 3, 4, 5, 6, 7}, sum, 3), 28);
}
