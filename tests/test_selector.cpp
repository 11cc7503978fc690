#include <gtest/gtest.h>
#include "selector/comparison_selector.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cstdio>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace pairank;

namespace {

/// c00 ranked first, c01 second, ... (scores strictly decreasing).
LogSnapshot makeLadder(int size) {
    LogSnapshot snapshot;
    for (int i = 0; i < size; i++) {
        char id[8];
        std::snprintf(id, sizeof(id), "c%02d", i);
        CandidateRecord c;
        c.id = id;
        c.score = static_cast<double>(size - i);
        snapshot.candidates.push_back(c);
    }
    return snapshot;
}

LogSnapshot makeScored(const std::vector<std::pair<std::string, double>>& scores) {
    LogSnapshot snapshot;
    for (const auto& [id, score] : scores) {
        CandidateRecord c;
        c.id = id;
        c.score = score;
        snapshot.candidates.push_back(c);
    }
    return snapshot;
}

void addComparison(LogSnapshot& snapshot, const std::string& a, const std::string& b) {
    ComparisonRecord r;
    r.id = static_cast<int64_t>(snapshot.comparisons.size()) + 1;
    r.candidate_a = a;
    r.candidate_b = b;
    r.winner = Winner::A;
    snapshot.comparisons.push_back(r);
    snapshot.version = r.id;
}

} // namespace

// ─── Budget split ──────────────────────────────────────────────

TEST(SelectorTest, CountsFromBudget) {
    auto ten = OpponentCounts::fromBudget(10);
    EXPECT_EQ(ten.random, 3);
    EXPECT_EQ(ten.quartile, 4);
    EXPECT_EQ(ten.neighbors, 3);

    auto twenty = OpponentCounts::fromBudget(20);
    EXPECT_EQ(twenty.random, 6);
    EXPECT_EQ(twenty.quartile, 4);
    EXPECT_EQ(twenty.neighbors, 10);

    auto tiny = OpponentCounts::fromBudget(1);
    EXPECT_EQ(tiny.random, 1);
    EXPECT_EQ(tiny.quartile, 1);
    EXPECT_EQ(tiny.neighbors, 1);
}

// ─── Phase 1 ───────────────────────────────────────────────────

TEST(SelectorTest, ExploreNeverSelfNeverTwice) {
    LogSnapshot snapshot = makeLadder(20);
    ComparisonSelector selector;

    for (uint64_t seed = 0; seed < 25; seed++) {
        SelectorRng rng(seed);
        auto picked = selector.explore("c07", snapshot, OpponentCounts{}, rng);
        ASSERT_EQ(picked.size(), 7u);
        std::set<std::string> unique(picked.begin(), picked.end());
        EXPECT_EQ(unique.size(), picked.size());
        EXPECT_EQ(unique.count("c07"), 0u);
    }
}

TEST(SelectorTest, ExploreSmallPoolReturnsEveryone) {
    LogSnapshot snapshot = makeLadder(5);
    ComparisonSelector selector;
    SelectorRng rng(1);

    auto picked = selector.explore("c02", snapshot, OpponentCounts{}, rng);
    std::vector<std::string> expected = {"c00", "c01", "c03", "c04"};
    EXPECT_EQ(picked, expected);
}

TEST(SelectorTest, ExploreSameSeedSameResult) {
    LogSnapshot snapshot = makeLadder(30);
    ComparisonSelector selector;

    SelectorRng first(1234);
    SelectorRng second(1234);
    EXPECT_EQ(selector.explore("c10", snapshot, OpponentCounts{}, first),
              selector.explore("c10", snapshot, OpponentCounts{}, second));
}

TEST(SelectorTest, QuartilePositions) {
    LogSnapshot snapshot = makeLadder(20);
    ComparisonSelector selector;
    SelectorRng rng(7);

    OpponentCounts counts;
    counts.random = 0;
    counts.quartile = 4;
    auto picked = selector.explore("newcomer", snapshot, counts, rng);
    std::vector<std::string> expected = {"c00", "c05", "c10", "c15"};
    EXPECT_EQ(picked, expected);
}

TEST(SelectorTest, ExploreAlwaysIncludesLeader) {
    LogSnapshot snapshot = makeLadder(40);
    ComparisonSelector selector;

    for (uint64_t seed = 0; seed < 25; seed++) {
        SelectorRng rng(seed);
        auto picked = selector.explore("c20", snapshot, OpponentCounts{}, rng);
        EXPECT_NE(std::find(picked.begin(), picked.end(), "c00"), picked.end());
    }
}

TEST(SelectorTest, SkipsAlreadyCompared) {
    LogSnapshot snapshot = makeLadder(6);
    addComparison(snapshot, "c00", "c03");
    addComparison(snapshot, "c04", "c00");

    ComparisonSelector selector;
    SelectorRng rng(3);
    auto picked = selector.explore("c00", snapshot, OpponentCounts{}, rng);
    std::vector<std::string> expected = {"c01", "c02", "c05"};
    EXPECT_EQ(picked, expected);

    SelectorConfig config;
    config.skip_compared = false;
    ComparisonSelector everyone(config);
    EXPECT_EQ(everyone.pool("c00", snapshot).size(), 5u);
}

// ─── Phase 2 ───────────────────────────────────────────────────

TEST(SelectorTest, RefinePicksClosestScores) {
    LogSnapshot snapshot = makeScored({
        {"target", 1.0},
        {"low", 0.5},
        {"near_low", 0.9},
        {"near_high", 1.2},
        {"top", 4.0},
    });
    ComparisonSelector selector;

    OpponentCounts counts;
    counts.neighbors = 2;
    auto picked = selector.refine("target", snapshot, counts);
    std::vector<std::string> expected = {"near_low", "near_high"};
    EXPECT_EQ(picked, expected);
}

TEST(SelectorTest, RefineTiesById) {
    LogSnapshot snapshot = makeScored({
        {"target", 2.0},
        {"zeta", 2.0},
        {"alpha", 2.0},
        {"far", 9.0},
    });
    ComparisonSelector selector;

    OpponentCounts counts;
    counts.neighbors = 2;
    std::vector<std::string> expected = {"alpha", "zeta"};
    EXPECT_EQ(selector.refine("target", snapshot, counts), expected);
}

TEST(SelectorTest, RefineSmallPool) {
    LogSnapshot snapshot = makeLadder(3);
    ComparisonSelector selector;

    OpponentCounts counts;
    counts.neighbors = 10;
    EXPECT_EQ(selector.refine("c01", snapshot, counts).size(), 2u);
}

TEST(SelectorTest, RefineUnknownTargetThrows) {
    LogSnapshot snapshot = makeLadder(4);
    ComparisonSelector selector;

    try {
        selector.refine("ghost", snapshot, OpponentCounts{});
        FAIL() << "refine accepted an unknown target";
    } catch (const UnknownCandidateError& e) {
        EXPECT_EQ(e.candidateId(), "ghost");
    }
}

TEST(SelectorTest, SelectDispatchesOnPhase) {
    LogSnapshot snapshot = makeLadder(12);
    ComparisonSelector selector;
    SelectorRng rng(5);
    SelectorRng same(5);

    EXPECT_EQ(selector.select("c04", snapshot, OpponentCounts{}, SelectionPhase::Refinement, rng),
              selector.refine("c04", snapshot, OpponentCounts{}));
    EXPECT_EQ(selector.select("c04", snapshot, OpponentCounts{}, SelectionPhase::Exploration, rng),
              selector.explore("c04", snapshot, OpponentCounts{}, same));
}
