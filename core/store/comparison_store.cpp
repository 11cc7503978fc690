#include "store/comparison_store.hpp"
#include "common/errors.hpp"
#include "logging/log.hpp"

#include <cmath>

namespace pairank {

namespace {

const char* kSchema = R"sql(
    CREATE TABLE IF NOT EXISTS candidates (
        candidate_id TEXT PRIMARY KEY,
        score        REAL    NOT NULL,
        wins         INTEGER NOT NULL DEFAULT 0,
        losses       INTEGER NOT NULL DEFAULT 0,
        ties         INTEGER NOT NULL DEFAULT 0,
        games        INTEGER NOT NULL DEFAULT 0,
        created_at   REAL    NOT NULL,
        updated_at   REAL    NOT NULL
    );

    CREATE TABLE IF NOT EXISTS comparisons (
        id          INTEGER PRIMARY KEY AUTOINCREMENT,
        candidate_a TEXT NOT NULL REFERENCES candidates(candidate_id),
        candidate_b TEXT NOT NULL REFERENCES candidates(candidate_id),
        winner      TEXT NOT NULL CHECK (winner IN ('a', 'b', 'tie')),
        reasoning   TEXT NOT NULL DEFAULT '',
        created_at  REAL NOT NULL,
        score_a_before REAL NOT NULL,
        score_b_before REAL NOT NULL,
        score_a_after  REAL,
        score_b_after  REAL,
        CHECK (candidate_a <> candidate_b)
    );

    CREATE INDEX IF NOT EXISTS idx_candidates_score ON candidates(score DESC);
    CREATE INDEX IF NOT EXISTS idx_comparisons_pair ON comparisons(candidate_a, candidate_b);
    CREATE INDEX IF NOT EXISTS idx_comparisons_b    ON comparisons(candidate_b);
)sql";

const char* kCandidateColumns =
    "candidate_id, score, wins, losses, ties, games, created_at, updated_at";

const char* kComparisonColumns =
    "id, candidate_a, candidate_b, winner, reasoning, created_at, "
    "score_a_before, score_b_before, score_a_after, score_b_after";

std::optional<double> optionalDouble(const Statement& stmt, int column) {
    if (stmt.columnIsNull(column)) return std::nullopt;
    return stmt.columnDouble(column);
}

CandidateRecord readCandidate(const Statement& stmt) {
    CandidateRecord c;
    c.id = stmt.columnText(0);
    c.score = stmt.columnDouble(1);
    c.wins = stmt.columnInt(2);
    c.losses = stmt.columnInt(3);
    c.ties = stmt.columnInt(4);
    c.games = stmt.columnInt(5);
    c.created_at = stmt.columnDouble(6);
    c.updated_at = stmt.columnDouble(7);
    return c;
}

ComparisonRecord readComparison(const Statement& stmt) {
    ComparisonRecord r;
    r.id = stmt.columnInt64(0);
    r.candidate_a = stmt.columnText(1);
    r.candidate_b = stmt.columnText(2);
    r.winner = parseWinner(stmt.columnText(3));
    r.reasoning = stmt.columnText(4);
    r.created_at = stmt.columnDouble(5);
    r.score_a_before = stmt.columnDouble(6);
    r.score_b_before = stmt.columnDouble(7);
    r.score_a_after = optionalDouble(stmt, 8);
    r.score_b_after = optionalDouble(stmt, 9);
    return r;
}

void requireId(const std::string& candidate_id) {
    if (candidate_id.empty()) {
        throw InvalidComparisonError("Candidate id must not be empty");
    }
}

} // namespace

// ─── Construction ──────────────────────────────────────────────

ComparisonStore::ComparisonStore(const StoreConfig& config) : config_(config) {
    if (config_.path.empty()) {
        throw StoreUnavailableError("Store path must not be empty");
    }
    db_ = std::make_unique<Database>(config_.path, config_.busy_timeout_ms);
    createSchema();
    PAIRANK_LOG_INFO("opened comparison store {} ({} candidates, {} comparisons)",
                     config_.path, candidateCount(), comparisonCount());
}

ComparisonStore::ComparisonStore(const std::string& path)
    : ComparisonStore(StoreConfig{path}) {}

void ComparisonStore::createSchema() {
    if (config_.write_ahead_log) {
        db_->exec("PRAGMA journal_mode=WAL");
        db_->exec("PRAGMA synchronous=NORMAL");
    }
    db_->exec("PRAGMA foreign_keys=ON");
    db_->exec(kSchema);
}

// ─── Writes ────────────────────────────────────────────────────

void ComparisonStore::insertCandidateIfMissing(const std::string& candidate_id, double now) {
    Statement insert(*db_,
        "INSERT OR IGNORE INTO candidates (candidate_id, score, created_at, updated_at) "
        "VALUES (?, ?, ?, ?)");
    insert.bind(1, candidate_id);
    insert.bind(2, kDefaultScore);
    insert.bind(3, now);
    insert.bind(4, now);
    insert.step();
}

bool ComparisonStore::registerCandidate(const std::string& candidate_id) {
    requireId(candidate_id);
    std::lock_guard<std::mutex> lock(mutex_);

    Transaction txn(*db_, Transaction::Mode::Immediate);
    insertCandidateIfMissing(candidate_id, nowSeconds());
    bool created = db_->changes() > 0;
    txn.commit();

    if (created) PAIRANK_LOG_DEBUG("registered candidate {}", candidate_id);
    return created;
}

int64_t ComparisonStore::record(const std::string& candidate_a,
                                const std::string& candidate_b,
                                Winner winner,
                                const std::string& reasoning) {
    requireId(candidate_a);
    requireId(candidate_b);
    if (candidate_a == candidate_b) {
        PAIRANK_LOG_WARN("rejected comparison of {} with itself", candidate_a);
        throw InvalidComparisonError("Candidate cannot be compared with itself: " + candidate_a);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    double now = nowSeconds();

    Transaction txn(*db_, Transaction::Mode::Immediate);
    insertCandidateIfMissing(candidate_a, now);
    insertCandidateIfMissing(candidate_b, now);

    Statement insert(*db_,
        "INSERT INTO comparisons (candidate_a, candidate_b, winner, reasoning, created_at, "
        "score_a_before, score_b_before) VALUES (?, ?, ?, ?, ?, "
        "(SELECT score FROM candidates WHERE candidate_id = ?), "
        "(SELECT score FROM candidates WHERE candidate_id = ?))");
    insert.bind(1, candidate_a);
    insert.bind(2, candidate_b);
    insert.bind(3, winnerToString(winner));
    insert.bind(4, reasoning);
    insert.bind(5, now);
    insert.bind(6, candidate_a);
    insert.bind(7, candidate_b);
    insert.step();
    int64_t comparison_id = db_->lastInsertId();

    Statement update(*db_,
        "UPDATE candidates SET games = games + 1, wins = wins + ?, losses = losses + ?, "
        "ties = ties + ?, updated_at = ? WHERE candidate_id = ?");

    auto tally = [&](const std::string& id, bool is_a) {
        bool tie = winner == Winner::Tie;
        bool won = !tie && ((winner == Winner::A) == is_a);
        update.reset();
        update.bind(1, won ? 1 : 0);
        update.bind(2, (!tie && !won) ? 1 : 0);
        update.bind(3, tie ? 1 : 0);
        update.bind(4, now);
        update.bind(5, id);
        update.step();
    };
    tally(candidate_a, true);
    tally(candidate_b, false);

    txn.commit();
    PAIRANK_LOG_DEBUG("recorded comparison #{}: {} vs {} -> {}",
                      comparison_id, candidate_a, candidate_b, winnerToString(winner));
    return comparison_id;
}

bool ComparisonStore::persistScores(const ScoreMap& scores,
                                    std::optional<int64_t> expected_version) {
    for (const auto& [id, score] : scores) {
        if (!std::isfinite(score) || score <= 0.0) {
            throw RankingError("Score for " + id + " must be finite and positive, got " +
                               std::to_string(score));
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(*db_, Transaction::Mode::Immediate);

    if (expected_version && readVersion() > *expected_version) {
        PAIRANK_LOG_DEBUG("skipping score write for log version {}: store is at {}",
                          *expected_version, readVersion());
        return false;  // txn rolls back, nothing was written
    }

    double now = nowSeconds();
    Statement update(*db_,
        "UPDATE candidates SET score = ?, updated_at = ? WHERE candidate_id = ?");
    for (const auto& [id, score] : scores) {
        update.reset();
        update.bind(1, score);
        update.bind(2, now);
        update.bind(3, id);
        update.step();
        if (db_->changes() == 0) {
            PAIRANK_LOG_WARN("rejected score write: unknown candidate {}", id);
            throw UnknownCandidateError(id);
        }
    }

    // Pairings this write covers get their post-recompute scores once.
    Statement settle(*db_,
        "UPDATE comparisons SET "
        "score_a_after = (SELECT score FROM candidates WHERE candidate_id = comparisons.candidate_a), "
        "score_b_after = (SELECT score FROM candidates WHERE candidate_id = comparisons.candidate_b) "
        "WHERE score_a_after IS NULL AND id <= ?");
    settle.bind(1, expected_version ? *expected_version : readVersion());
    settle.step();

    txn.commit();
    return true;
}

// ─── Reads ─────────────────────────────────────────────────────

LogSnapshot ComparisonStore::loadAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    LogSnapshot snapshot;

    Transaction txn(*db_, Transaction::Mode::Deferred);

    Statement candidates(*db_, std::string("SELECT ") + kCandidateColumns +
                               " FROM candidates ORDER BY candidate_id");
    while (candidates.step()) {
        snapshot.candidates.push_back(readCandidate(candidates));
    }

    Statement comparisons(*db_, std::string("SELECT ") + kComparisonColumns +
                                " FROM comparisons ORDER BY id");
    while (comparisons.step()) {
        snapshot.comparisons.push_back(readComparison(comparisons));
    }

    snapshot.version = readVersion();
    txn.commit();
    return snapshot;
}

std::optional<CandidateRecord> ComparisonStore::candidate(const std::string& candidate_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(*db_, std::string("SELECT ") + kCandidateColumns +
                         " FROM candidates WHERE candidate_id = ?");
    stmt.bind(1, candidate_id);
    if (stmt.step()) return readCandidate(stmt);
    return std::nullopt;
}

bool ComparisonStore::contains(const std::string& candidate_id) const {
    return candidate(candidate_id).has_value();
}

std::vector<CandidateRecord> ComparisonStore::rankings(const RankingQuery& query) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(*db_, std::string("SELECT ") + kCandidateColumns +
                         " FROM candidates WHERE games >= ?"
                         " ORDER BY score DESC, candidate_id ASC LIMIT ?");
    stmt.bind(1, query.min_games);
    stmt.bind(2, query.top_n > 0 ? static_cast<int64_t>(query.top_n) : int64_t{-1});

    std::vector<CandidateRecord> result;
    while (stmt.step()) {
        result.push_back(readCandidate(stmt));
    }
    return result;
}

std::vector<ComparisonRecord> ComparisonStore::history(const std::string& candidate_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(*db_, std::string("SELECT ") + kComparisonColumns +
                         " FROM comparisons WHERE candidate_a = ? OR candidate_b = ?"
                         " ORDER BY id DESC");
    stmt.bind(1, candidate_id);
    stmt.bind(2, candidate_id);

    std::vector<ComparisonRecord> result;
    while (stmt.step()) {
        result.push_back(readComparison(stmt));
    }
    return result;
}

std::optional<ComparisonRecord> ComparisonStore::comparison(const std::string& candidate_a,
                                                            const std::string& candidate_b) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(*db_, std::string("SELECT ") + kComparisonColumns +
                         " FROM comparisons"
                         " WHERE (candidate_a = ? AND candidate_b = ?) OR (candidate_a = ? AND candidate_b = ?)"
                         " ORDER BY id DESC LIMIT 1");
    stmt.bind(1, candidate_a);
    stmt.bind(2, candidate_b);
    stmt.bind(3, candidate_b);
    stmt.bind(4, candidate_a);
    if (stmt.step()) return readComparison(stmt);
    return std::nullopt;
}

std::vector<ComparisonRecord> ComparisonStore::comparisons() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(*db_, std::string("SELECT ") + kComparisonColumns +
                         " FROM comparisons ORDER BY id DESC");
    std::vector<ComparisonRecord> result;
    while (stmt.step()) {
        result.push_back(readComparison(stmt));
    }
    return result;
}

int ComparisonStore::pairCount(const std::string& candidate_a,
                               const std::string& candidate_b) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(*db_,
        "SELECT COUNT(*) FROM comparisons "
        "WHERE (candidate_a = ? AND candidate_b = ?) OR (candidate_a = ? AND candidate_b = ?)");
    stmt.bind(1, candidate_a);
    stmt.bind(2, candidate_b);
    stmt.bind(3, candidate_b);
    stmt.bind(4, candidate_a);
    return stmt.step() ? stmt.columnInt(0) : 0;
}

size_t ComparisonStore::candidateCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(*db_, "SELECT COUNT(*) FROM candidates");
    return stmt.step() ? static_cast<size_t>(stmt.columnInt64(0)) : 0;
}

size_t ComparisonStore::comparisonCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(*db_, "SELECT COUNT(*) FROM comparisons");
    return stmt.step() ? static_cast<size_t>(stmt.columnInt64(0)) : 0;
}

int64_t ComparisonStore::logVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return readVersion();
}

int64_t ComparisonStore::readVersion() const {
    Statement stmt(*db_, "SELECT COALESCE(MAX(id), 0) FROM comparisons");
    return stmt.step() ? stmt.columnInt64(0) : 0;
}

} // namespace pairank
