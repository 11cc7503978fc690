#include "solver/bt_mm_solver.hpp"
#include "solver/iteration_budget.hpp"
#include "solver/pairwise_tally.hpp"

#include <algorithm>
#include <cmath>

namespace pairank {

SolveResult MinorizeMaximizeSolver::solve(const LogSnapshot& snapshot) const {
    PairwiseTally tally = PairwiseTally::build(snapshot);
    const size_t n = tally.size();

    SolveResult result;
    result.solver = name();

    std::vector<double> scores(n, kDefaultScore);
    std::vector<double> next(n, kDefaultScore);
    double reference = kPhantomReference;

    IterationBudget budget(config_.max_iterations);
    budget.start();

    bool converged = (n == 0);
    double delta = 0.0;

    while (!converged && budget.canContinue()) {
        for (size_t i = 0; i < n; i++) {
            double denom = kPhantomGames / (scores[i] + reference);
            for (const auto& [j, n_ij] : tally.opponents[i]) {
                denom += n_ij / (scores[i] + scores[j]);
            }
            next[i] = (tally.wins[i] + 0.5 * kPhantomGames) / denom;
        }
        normalizeGeometricMean(next, &reference);

        delta = 0.0;
        for (size_t i = 0; i < n; i++) {
            delta = std::max(delta, std::abs(next[i] - scores[i]));
        }
        scores.swap(next);
        budget.recordIteration();

        converged = delta < config_.tolerance;
    }

    result.scores = assembleScores(snapshot, tally, scores);
    result.iterations = budget.iterations();
    result.max_delta = delta;
    result.converged = converged;
    reportConvergence(result, budget.elapsedSeconds());
    return result;
}

} // namespace pairank
