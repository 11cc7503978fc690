#pragma once

#include "common/types.hpp"
#include "selector/comparison_selector.hpp"
#include "solver/solver.hpp"
#include "store/comparison_store.hpp"

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pairank {

struct RankingConfig {
    SolverConfig solver;
    SelectorConfig selector;
    SolverKind solver_kind = SolverKind::Auto;
    std::optional<uint64_t> seed;   // unset: seeded from std::random_device
};

/// Outcome of one full recompute.
struct RecomputeReport {
    int64_t comparison_id = 0;  // set by submitResult
    int64_t log_version = 0;    // snapshot the scores were computed from
    int iterations = 0;
    double max_delta = 0.0;
    bool converged = true;
    bool persisted = false;     // false: a newer write superseded this run
    std::string solver;
    std::optional<ConvergenceWarning> warning;
    std::optional<std::string> error;   // recompute failed after the comparison was logged
};

struct ExportMetadata {
    std::string algorithm;
    double tolerance = 0.0;
    int max_iterations = 0;
    size_t total_candidates = 0;
    size_t total_comparisons = 0;
    double exported_at = 0.0;
};

/// Full snapshot of the ranking: candidates in ranking order,
/// comparisons newest first.
struct RankingExport {
    ExportMetadata metadata;
    std::vector<CandidateRecord> candidates;
    std::vector<ComparisonRecord> comparisons;
};

// ─── Ranking Engine ────────────────────────────────────────────
// Entry point for the evaluation loop. Every submitted result is
// logged, then all scores are re-derived from the full log and
// persisted, so the ranking never depends on submission order.
// The engine holds no ranking state of its own; the store does.

class RankingEngine {
public:
    explicit RankingEngine(ComparisonStore& store, RankingConfig config = {});

    /// Use the given solver instead of config.solver_kind.
    RankingEngine(ComparisonStore& store, std::unique_ptr<Solver> solver,
                  RankingConfig config = {});

    RankingEngine(const RankingEngine&) = delete;
    RankingEngine& operator=(const RankingEngine&) = delete;

    /// Record a judged pairing and recompute every score.
    /// Once the pairing is logged this does not throw: a failed
    /// recompute is reported through persisted and error, and a
    /// later recompute() catches up. Do not resubmit.
    RecomputeReport submitResult(const std::string& candidate_a,
                                 const std::string& candidate_b,
                                 Winner winner,
                                 const std::string& reasoning = "");

    /// Same, with the judge's textual verdict ("a", "b" or "tie").
    RecomputeReport submitResult(const std::string& candidate_a,
                                 const std::string& candidate_b,
                                 const std::string& winner,
                                 const std::string& reasoning = "");

    /// Opponents the candidate should be judged against next.
    std::vector<std::string> nextOpponents(const std::string& candidate_id,
                                           const OpponentCounts& counts = {},
                                           SelectionPhase phase = SelectionPhase::Exploration);

    std::vector<CandidateRecord> getRankings(const RankingQuery& query = {}) const;

    bool registerCandidate(const std::string& candidate_id);

    /// Re-derive all scores from the log and persist them.
    RecomputeReport recompute();

    /// (id, score) for every candidate, in ranking order.
    std::vector<std::pair<std::string, double>> exportScores() const;

    /// Everything in the store, read in one transaction.
    RankingExport exportData() const;

    /// Most recent comparison of the pair, if any.
    std::optional<ComparisonRecord> comparison(const std::string& candidate_a,
                                               const std::string& candidate_b) const;

    /// Throws UnknownCandidateError for an unregistered id.
    CandidateRecord stats(const std::string& candidate_id) const;

    std::vector<ComparisonRecord> history(const std::string& candidate_id) const;

    /// Human-readable leaderboard of the top entries. Leaves the
    /// stream's formatting state untouched.
    void writeRankingTable(std::ostream& out, size_t top_n = 10) const;

    std::string solverName() const { return solver_->name(); }

    const RankingConfig& config() const { return config_; }

private:
    ComparisonStore& store_;
    RankingConfig config_;
    std::unique_ptr<Solver> solver_;
    ComparisonSelector selector_;
    SelectorRng rng_;
};

} // namespace pairank
