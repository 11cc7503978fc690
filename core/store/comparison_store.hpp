#pragma once

#include "common/types.hpp"
#include "store/sqlite_handle.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pairank {

struct StoreConfig {
    std::string path;               // database file, created if missing
    int busy_timeout_ms = 5000;     // lock wait before StoreUnavailableError
    bool write_ahead_log = true;    // readers never block the writer
};

/// Filters for ranking queries. Zero means "no limit".
struct RankingQuery {
    size_t top_n = 0;
    int min_games = 0;
};

// ─── Comparison Store ──────────────────────────────────────────
// Durable log of candidates and pairwise outcomes, backed by one
// sqlite3 file. The single source of truth: nothing is cached, every
// read goes to the database and every write is one short exclusive
// transaction. Several stores (threads or processes) may share a file.

class ComparisonStore {
public:
    explicit ComparisonStore(const StoreConfig& config);
    explicit ComparisonStore(const std::string& path);

    ComparisonStore(const ComparisonStore&) = delete;
    ComparisonStore& operator=(const ComparisonStore&) = delete;

    /// Create the candidate at the default score if absent.
    /// Returns true when a new row was created.
    bool registerCandidate(const std::string& candidate_id);

    /// Append one judged pairing and update both candidates' counts.
    /// Missing candidates are created. Both current scores are stored
    /// with the pairing. Returns the comparison id.
    int64_t record(const std::string& candidate_a,
                   const std::string& candidate_b,
                   Winner winner,
                   const std::string& reasoning = "");

    /// Candidate table, comparison log and log version as one snapshot.
    LogSnapshot loadAll() const;

    /// Overwrite the score of exactly the listed candidates.
    /// With expected_version set, writes nothing and returns false when
    /// the log has grown past that version since the scores were computed.
    /// A successful write also fills the "after" scores of every pairing
    /// up to that version that does not have them yet.
    bool persistScores(const ScoreMap& scores,
                       std::optional<int64_t> expected_version = std::nullopt);

    std::optional<CandidateRecord> candidate(const std::string& candidate_id) const;
    bool contains(const std::string& candidate_id) const;

    /// Score descending, candidate id ascending.
    std::vector<CandidateRecord> rankings(const RankingQuery& query = {}) const;

    /// Comparisons involving a candidate, newest first.
    std::vector<ComparisonRecord> history(const std::string& candidate_id) const;

    /// Most recent comparison of the pair, in either orientation.
    std::optional<ComparisonRecord> comparison(const std::string& candidate_a,
                                               const std::string& candidate_b) const;

    /// Whole log, newest first.
    std::vector<ComparisonRecord> comparisons() const;

    /// Number of logged comparisons of the pair, in either orientation.
    int pairCount(const std::string& candidate_a, const std::string& candidate_b) const;

    size_t candidateCount() const;
    size_t comparisonCount() const;

    /// Largest comparison id, 0 for an empty log.
    int64_t logVersion() const;

    const std::string& path() const { return config_.path; }

private:
    StoreConfig config_;
    std::unique_ptr<Database> db_;
    mutable std::mutex mutex_;

    void createSchema();
    void insertCandidateIfMissing(const std::string& candidate_id, double now);
    int64_t readVersion() const;
};

} // namespace pairank
