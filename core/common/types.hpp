#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pairank {

/// Score of a candidate that has never been compared.
constexpr double kDefaultScore = 1.0;

// ─── Winner ────────────────────────────────────────────────────

enum class Winner {
    A,
    B,
    Tie
};

/// Parse "a", "b" or "tie" (any case). Throws InvalidComparisonError.
Winner parseWinner(const std::string& text);

/// Inverse of parseWinner: "a", "b" or "tie".
std::string winnerToString(Winner winner);

// ─── Candidate ─────────────────────────────────────────────────
// One row of the candidate table. Counts are maintained by the store,
// the score by the solver.

struct CandidateRecord {
    std::string id;
    double score = kDefaultScore;
    int wins = 0;
    int losses = 0;
    int ties = 0;
    int games = 0;
    double created_at = 0.0;   // seconds since epoch
    double updated_at = 0.0;

    /// Ties count as half a win. 0 for a candidate without games.
    double winRate() const {
        return games > 0 ? (wins + 0.5 * ties) / games : 0.0;
    }
};

// ─── Comparison ────────────────────────────────────────────────
// One judged pairing. Append-only, except that the "after" scores are
// filled by the first score write that includes the pairing.

struct ComparisonRecord {
    int64_t id = 0;
    std::string candidate_a;
    std::string candidate_b;
    Winner winner = Winner::Tie;
    std::string reasoning;
    double created_at = 0.0;
    double score_a_before = kDefaultScore;  // stored scores when recorded
    double score_b_before = kDefaultScore;
    std::optional<double> score_a_after;    // unset until scores are persisted
    std::optional<double> score_b_after;

    std::optional<double> scoreChangeA() const {
        if (!score_a_after) return std::nullopt;
        return *score_a_after - score_a_before;
    }
    std::optional<double> scoreChangeB() const {
        if (!score_b_after) return std::nullopt;
        return *score_b_after - score_b_before;
    }
};

// ─── Log Snapshot ──────────────────────────────────────────────
// Candidate table plus comparison log read in a single transaction.
// version is the largest comparison id (0 for an empty log).

struct LogSnapshot {
    std::vector<CandidateRecord> candidates;
    std::vector<ComparisonRecord> comparisons;
    int64_t version = 0;

    const CandidateRecord* find(const std::string& id) const;
};

using ScoreMap = std::unordered_map<std::string, double>;

/// Wall-clock time in seconds since epoch.
inline double nowSeconds() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_epoch).count();
}

} // namespace pairank
