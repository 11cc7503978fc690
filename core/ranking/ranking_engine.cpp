#include "ranking/ranking_engine.hpp"
#include "common/errors.hpp"
#include "logging/log.hpp"

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <random>
#include <sstream>

namespace pairank {

namespace {

uint64_t seedFrom(const std::optional<uint64_t>& seed) {
    if (seed) return *seed;
    std::random_device device;
    return (static_cast<uint64_t>(device()) << 32) | device();
}

} // namespace

RankingEngine::RankingEngine(ComparisonStore& store, RankingConfig config)
    : store_(store),
      config_(std::move(config)),
      solver_(makeSolver(config_.solver_kind, config_.solver)),
      selector_(config_.selector),
      rng_(seedFrom(config_.seed)) {
    PAIRANK_LOG_INFO("Ranking engine on {} using {}", store_.path(), solver_->name());
}

RankingEngine::RankingEngine(ComparisonStore& store, std::unique_ptr<Solver> solver,
                             RankingConfig config)
    : store_(store),
      config_(std::move(config)),
      solver_(std::move(solver)),
      selector_(config_.selector),
      rng_(seedFrom(config_.seed)) {
    if (!solver_) throw RankingError("Ranking engine needs a solver");
    PAIRANK_LOG_INFO("Ranking engine on {} using {}", store_.path(), solver_->name());
}

// ─── Results ───────────────────────────────────────────────────

RecomputeReport RankingEngine::submitResult(const std::string& candidate_a,
                                            const std::string& candidate_b,
                                            Winner winner,
                                            const std::string& reasoning) {
    if (candidate_a.empty() || candidate_b.empty()) {
        throw InvalidComparisonError("Candidate ids must not be empty");
    }
    if (candidate_a == candidate_b) {
        throw InvalidComparisonError("Candidate cannot be compared with itself: " + candidate_a);
    }

    int64_t comparison_id = store_.record(candidate_a, candidate_b, winner, reasoning);
    PAIRANK_LOG_INFO("Comparison #{}: {} vs {} -> {}",
                     comparison_id, candidate_a, candidate_b, winnerToString(winner));

    RecomputeReport report;
    try {
        report = recompute();
    } catch (const RankingError& e) {
        PAIRANK_LOG_WARN("Comparison #{} logged but scores not updated: {}",
                         comparison_id, e.what());
        report.log_version = comparison_id;
        report.persisted = false;
        report.solver = solverName();
        report.error = e.what();
    }
    report.comparison_id = comparison_id;
    return report;
}

RecomputeReport RankingEngine::submitResult(const std::string& candidate_a,
                                            const std::string& candidate_b,
                                            const std::string& winner,
                                            const std::string& reasoning) {
    return submitResult(candidate_a, candidate_b, parseWinner(winner), reasoning);
}

RecomputeReport RankingEngine::recompute() {
    LogSnapshot snapshot = store_.loadAll();
    SolveResult solved = solver_->solve(snapshot);

    RecomputeReport report;
    report.log_version = snapshot.version;
    report.iterations = solved.iterations;
    report.max_delta = solved.max_delta;
    report.converged = solved.converged;
    report.solver = solved.solver;
    report.warning = std::move(solved.warning);
    report.persisted = store_.persistScores(solved.scores, snapshot.version);

    if (!report.persisted) {
        PAIRANK_LOG_DEBUG("Scores from log version {} superseded by a newer write",
                          snapshot.version);
    }
    return report;
}

bool RankingEngine::registerCandidate(const std::string& candidate_id) {
    return store_.registerCandidate(candidate_id);
}

// ─── Selection ─────────────────────────────────────────────────

std::vector<std::string> RankingEngine::nextOpponents(const std::string& candidate_id,
                                                      const OpponentCounts& counts,
                                                      SelectionPhase phase) {
    LogSnapshot snapshot = store_.loadAll();
    if (!snapshot.find(candidate_id)) {
        throw UnknownCandidateError(candidate_id);
    }
    return selector_.select(candidate_id, snapshot, counts, phase, rng_);
}

// ─── Queries ───────────────────────────────────────────────────

std::vector<CandidateRecord> RankingEngine::getRankings(const RankingQuery& query) const {
    return store_.rankings(query);
}

std::vector<std::pair<std::string, double>> RankingEngine::exportScores() const {
    std::vector<std::pair<std::string, double>> scores;
    for (const auto& record : store_.rankings()) {
        scores.emplace_back(record.id, record.score);
    }
    return scores;
}

RankingExport RankingEngine::exportData() const {
    LogSnapshot snapshot = store_.loadAll();

    RankingExport data;
    data.metadata.algorithm = solverName();
    data.metadata.tolerance = config_.solver.tolerance;
    data.metadata.max_iterations = config_.solver.max_iterations;
    data.metadata.total_candidates = snapshot.candidates.size();
    data.metadata.total_comparisons = snapshot.comparisons.size();
    data.metadata.exported_at = nowSeconds();

    // Same order as ComparisonStore::rankings.
    data.candidates = std::move(snapshot.candidates);
    std::sort(data.candidates.begin(), data.candidates.end(),
              [](const CandidateRecord& x, const CandidateRecord& y) {
                  if (x.score != y.score) return x.score > y.score;
                  return x.id < y.id;
              });
    data.comparisons.assign(snapshot.comparisons.rbegin(), snapshot.comparisons.rend());
    return data;
}

std::optional<ComparisonRecord> RankingEngine::comparison(const std::string& candidate_a,
                                                          const std::string& candidate_b) const {
    return store_.comparison(candidate_a, candidate_b);
}

CandidateRecord RankingEngine::stats(const std::string& candidate_id) const {
    auto record = store_.candidate(candidate_id);
    if (!record) throw UnknownCandidateError(candidate_id);
    return *record;
}

std::vector<ComparisonRecord> RankingEngine::history(const std::string& candidate_id) const {
    return store_.history(candidate_id);
}

void RankingEngine::writeRankingTable(std::ostream& out, size_t top_n) const {
    RankingQuery query;
    query.top_n = top_n;
    auto rows = store_.rankings(query);

    std::ostringstream table;
    table << "Rank  " << std::left << std::setw(24) << "Candidate"
        << std::right << std::setw(10) << "Score"
        << std::setw(7) << "W" << std::setw(7) << "L" << std::setw(7) << "T"
        << std::setw(9) << "Win%" << '\n';
    table << std::string(70, '-') << '\n';

    size_t rank = 1;
    for (const auto& row : rows) {
        table << std::left << std::setw(6) << rank++
            << std::setw(24) << row.id
            << std::right << std::fixed << std::setprecision(4) << std::setw(10) << row.score
            << std::setw(7) << row.wins << std::setw(7) << row.losses << std::setw(7) << row.ties
            << std::setprecision(1) << std::setw(8) << row.winRate() * 100.0 << "%\n";
    }
    out << table.str();
}

} // namespace pairank
