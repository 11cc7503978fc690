#include <gtest/gtest.h>
#include "store/comparison_store.hpp"
#include "common/errors.hpp"
#include "temp_database.hpp"

#include <sqlite3.h>

#include <cmath>
#include <filesystem>
#include <string>
#include <thread>

using namespace pairank;

using pairank::test_support::TempDatabase;

// ─── Registration ──────────────────────────────────────────────

TEST(StoreTest, RegisterIsIdempotent) {
    TempDatabase db("register");
    ComparisonStore store(db.path);

    EXPECT_TRUE(store.registerCandidate("alpha"));
    EXPECT_FALSE(store.registerCandidate("alpha"));
    EXPECT_EQ(store.candidateCount(), 1u);

    auto record = store.candidate("alpha");
    ASSERT_TRUE(record.has_value());
    EXPECT_DOUBLE_EQ(record->score, kDefaultScore);
    EXPECT_EQ(record->games, 0);
    EXPECT_DOUBLE_EQ(record->winRate(), 0.0);
}

TEST(StoreTest, EmptyIdRejected) {
    TempDatabase db("empty_id");
    ComparisonStore store(db.path);

    EXPECT_THROW(store.registerCandidate(""), InvalidComparisonError);
    EXPECT_THROW(store.record("", "b", Winner::A), InvalidComparisonError);
    EXPECT_EQ(store.candidateCount(), 0u);
}

// ─── Recording ─────────────────────────────────────────────────

TEST(StoreTest, RecordUpdatesCounts) {
    TempDatabase db("counts");
    ComparisonStore store(db.path);

    store.record("a", "b", Winner::A, "clearer proof");
    store.record("a", "b", Winner::B);
    store.record("b", "a", Winner::Tie);

    auto a = store.candidate("a");
    auto b = store.candidate("b");
    ASSERT_TRUE(a && b);

    EXPECT_EQ(a->wins, 1);
    EXPECT_EQ(a->losses, 1);
    EXPECT_EQ(a->ties, 1);
    EXPECT_EQ(a->games, 3);
    EXPECT_EQ(b->wins, 1);
    EXPECT_EQ(b->losses, 1);
    EXPECT_EQ(b->ties, 1);
    EXPECT_EQ(b->games, 3);
    EXPECT_NEAR(a->winRate(), 0.5, 1e-12);

    EXPECT_EQ(store.comparisonCount(), 3u);
    EXPECT_EQ(store.logVersion(), 3);
}

TEST(StoreTest, RecordCreatesMissingCandidates) {
    TempDatabase db("create");
    ComparisonStore store(db.path);

    int64_t first = store.record("x", "y", Winner::A);
    int64_t second = store.record("y", "z", Winner::B);

    EXPECT_LT(first, second);
    EXPECT_EQ(store.candidateCount(), 3u);
    EXPECT_TRUE(store.contains("z"));
    EXPECT_FALSE(store.contains("w"));
}

TEST(StoreTest, SelfComparisonLeavesNoTrace) {
    TempDatabase db("self");
    ComparisonStore store(db.path);

    EXPECT_THROW(store.record("solo", "solo", Winner::A), InvalidComparisonError);
    EXPECT_EQ(store.candidateCount(), 0u);
    EXPECT_EQ(store.comparisonCount(), 0u);
    EXPECT_EQ(store.logVersion(), 0);
}

TEST(StoreTest, HistoryNewestFirst) {
    TempDatabase db("history");
    ComparisonStore store(db.path);

    store.record("a", "b", Winner::A, "first");
    store.record("c", "d", Winner::A);
    store.record("b", "a", Winner::Tie, "second");

    auto history = store.history("a");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].reasoning, "second");
    EXPECT_EQ(history[0].winner, Winner::Tie);
    EXPECT_EQ(history[1].reasoning, "first");
    EXPECT_GT(history[0].id, history[1].id);

    EXPECT_EQ(store.pairCount("a", "b"), 2);
    EXPECT_EQ(store.pairCount("b", "a"), 2);
    EXPECT_EQ(store.pairCount("a", "c"), 0);
}

TEST(StoreTest, LoadAllIsConsistent) {
    TempDatabase db("snapshot");
    ComparisonStore store(db.path);

    store.registerCandidate("lonely");
    store.record("a", "b", Winner::A);
    store.record("b", "c", Winner::B);

    LogSnapshot snapshot = store.loadAll();
    EXPECT_EQ(snapshot.candidates.size(), 4u);
    EXPECT_EQ(snapshot.comparisons.size(), 2u);
    EXPECT_EQ(snapshot.version, snapshot.comparisons.back().id);
    ASSERT_NE(snapshot.find("lonely"), nullptr);
    EXPECT_EQ(snapshot.find("lonely")->games, 0);
    EXPECT_EQ(snapshot.find("missing"), nullptr);
}

// ─── Scores ────────────────────────────────────────────────────

TEST(StoreTest, PersistScoresAndRank) {
    TempDatabase db("persist");
    ComparisonStore store(db.path);

    store.registerCandidate("b");
    store.registerCandidate("a");
    store.registerCandidate("c");

    EXPECT_TRUE(store.persistScores({{"a", 2.0}, {"b", 2.0}, {"c", 0.5}}));

    auto ranked = store.rankings();
    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(ranked[0].id, "a");  // equal scores: id ascending
    EXPECT_EQ(ranked[1].id, "b");
    EXPECT_EQ(ranked[2].id, "c");

    RankingQuery query;
    query.top_n = 1;
    EXPECT_EQ(store.rankings(query).size(), 1u);
}

TEST(StoreTest, RankingsFilterByGames) {
    TempDatabase db("min_games");
    ComparisonStore store(db.path);

    store.registerCandidate("idle");
    store.record("a", "b", Winner::A);

    RankingQuery query;
    query.min_games = 1;
    auto ranked = store.rankings(query);
    ASSERT_EQ(ranked.size(), 2u);
    for (const auto& row : ranked) {
        EXPECT_NE(row.id, "idle");
    }
}

TEST(StoreTest, PersistUnknownRollsBack) {
    TempDatabase db("unknown");
    ComparisonStore store(db.path);

    store.registerCandidate("a");
    EXPECT_THROW(store.persistScores({{"a", 3.0}, {"ghost", 2.0}}), UnknownCandidateError);
    EXPECT_DOUBLE_EQ(store.candidate("a")->score, kDefaultScore);
    EXPECT_FALSE(store.contains("ghost"));
}

TEST(StoreTest, PersistRejectsInvalidScores) {
    TempDatabase db("invalid_score");
    ComparisonStore store(db.path);

    store.registerCandidate("a");
    EXPECT_THROW(store.persistScores({{"a", 0.0}}), RankingError);
    EXPECT_THROW(store.persistScores({{"a", -1.0}}), RankingError);
    EXPECT_THROW(store.persistScores({{"a", std::nan("")}}), RankingError);
    EXPECT_DOUBLE_EQ(store.candidate("a")->score, kDefaultScore);
}

TEST(StoreTest, StaleVersionSkipsWrite) {
    TempDatabase db("stale");
    ComparisonStore store(db.path);

    store.record("a", "b", Winner::A);
    int64_t seen = store.logVersion();
    store.record("a", "b", Winner::A);

    EXPECT_FALSE(store.persistScores({{"a", 4.0}}, seen));
    EXPECT_DOUBLE_EQ(store.candidate("a")->score, kDefaultScore);

    EXPECT_TRUE(store.persistScores({{"a", 4.0}}, store.logVersion()));
    EXPECT_DOUBLE_EQ(store.candidate("a")->score, 4.0);
}

TEST(StoreTest, ComparisonKeepsScoresAroundIt) {
    TempDatabase db("before_after");
    ComparisonStore store(db.path);

    store.record("a", "b", Winner::A);
    auto first = store.comparison("a", "b");
    ASSERT_TRUE(first.has_value());
    EXPECT_DOUBLE_EQ(first->score_a_before, kDefaultScore);
    EXPECT_DOUBLE_EQ(first->score_b_before, kDefaultScore);
    EXPECT_FALSE(first->score_a_after.has_value());
    EXPECT_FALSE(first->scoreChangeB().has_value());

    ASSERT_TRUE(store.persistScores({{"a", 2.0}, {"b", 0.5}}, store.logVersion()));
    first = store.comparison("a", "b");
    ASSERT_TRUE(first->score_a_after && first->score_b_after);
    EXPECT_DOUBLE_EQ(*first->score_a_after, 2.0);
    EXPECT_DOUBLE_EQ(*first->scoreChangeA(), 1.0);
    EXPECT_DOUBLE_EQ(*first->scoreChangeB(), -0.5);

    int64_t seen = store.logVersion();
    store.record("b", "a", Winner::A);
    auto second = store.comparison("a", "b");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->candidate_a, "b");
    EXPECT_DOUBLE_EQ(second->score_a_before, 0.5);
    EXPECT_DOUBLE_EQ(second->score_b_before, 2.0);

    // A stale write settles nothing; a later write settles only what is still open.
    EXPECT_FALSE(store.persistScores({{"a", 1.0}, {"b", 1.0}}, seen));
    EXPECT_FALSE(store.comparison("a", "b")->score_a_after.has_value());
    ASSERT_TRUE(store.persistScores({{"a", 1.0}, {"b", 1.0}}));

    auto log = store.comparisons();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0].id, second->id);
    EXPECT_DOUBLE_EQ(*log[0].score_a_after, 1.0);
    EXPECT_DOUBLE_EQ(*log[1].score_a_after, 2.0);
}

TEST(StoreTest, ComparisonLookupMissingPair) {
    TempDatabase db("lookup");
    ComparisonStore store(db.path);

    store.record("a", "b", Winner::Tie);
    EXPECT_FALSE(store.comparison("a", "c").has_value());
    EXPECT_FALSE(store.comparison("x", "y").has_value());
    EXPECT_EQ(store.comparison("b", "a")->winner, Winner::Tie);
}

// ─── Durability & Locking ──────────────────────────────────────

TEST(StoreTest, SurvivesReopen) {
    TempDatabase db("reopen");
    {
        ComparisonStore store(db.path);
        store.record("a", "b", Winner::B, "kept");
        store.persistScores({{"a", 0.5}, {"b", 2.0}});
    }

    ComparisonStore reopened(db.path);
    EXPECT_EQ(reopened.comparisonCount(), 1u);
    EXPECT_DOUBLE_EQ(reopened.candidate("b")->score, 2.0);
    EXPECT_EQ(reopened.candidate("b")->wins, 1);
    EXPECT_EQ(reopened.history("a").front().reasoning, "kept");
}

TEST(StoreTest, HeldLockIsUnavailable) {
    TempDatabase db("locked");
    StoreConfig config;
    config.path = db.path;
    config.busy_timeout_ms = 50;
    ComparisonStore store(config);
    store.registerCandidate("a");

    sqlite3* other = nullptr;
    ASSERT_EQ(sqlite3_open(db.path.c_str(), &other), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(other, "BEGIN EXCLUSIVE", nullptr, nullptr, nullptr), SQLITE_OK);

    try {
        store.record("a", "b", Winner::A);
        FAIL() << "record succeeded while the database was locked";
    } catch (const StoreUnavailableError& e) {
        EXPECT_TRUE(e.retryable());
    }

    sqlite3_exec(other, "ROLLBACK", nullptr, nullptr, nullptr);
    sqlite3_close(other);

    EXPECT_EQ(store.comparisonCount(), 0u);
    EXPECT_FALSE(store.contains("b"));
    EXPECT_NO_THROW(store.record("a", "b", Winner::A));
}

TEST(StoreTest, UnopenablePathIsUnavailable) {
    auto missing = std::filesystem::temp_directory_path() / "pairank_no_such_dir" / "x.db";
    EXPECT_THROW(ComparisonStore store(missing.string()), StoreUnavailableError);
}

TEST(StoreTest, ConcurrentWritersKeepCountsConsistent) {
    TempDatabase db("concurrent");
    ComparisonStore first(db.path);
    ComparisonStore second(db.path);

    const int per_thread = 25;
    auto writer = [per_thread](ComparisonStore& store, const std::string& winner) {
        for (int i = 0; i < per_thread; i++) {
            store.record("a", "b", winner == "a" ? Winner::A : Winner::B);
        }
    };

    std::thread t1(writer, std::ref(first), "a");
    std::thread t2(writer, std::ref(second), "b");
    t1.join();
    t2.join();

    EXPECT_EQ(first.comparisonCount(), static_cast<size_t>(2 * per_thread));
    auto a = first.candidate("a");
    auto b = second.candidate("b");
    EXPECT_EQ(a->wins, per_thread);
    EXPECT_EQ(a->losses, per_thread);
    EXPECT_EQ(a->games, 2 * per_thread);
    EXPECT_EQ(b->games, 2 * per_thread);
}
