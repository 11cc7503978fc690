#include "solver/newton_dogleg_solver.hpp"
#include "solver/iteration_budget.hpp"
#include "solver/pairwise_tally.hpp"

#include <Eigen/Core>
#include <unsupported/Eigen/NonLinearOptimization>

#include <algorithm>
#include <cmath>
#include <limits>

namespace pairank {

namespace {

double logistic(double t) {
    return 1.0 / (1.0 + std::exp(-t));
}

// Gradient of the damped log-likelihood in log-strength space, with its
// Hessian as the Jacobian. Functor protocol of HybridNonLinearSolver:
// operator() fills the residual, df the Jacobian, negative return aborts.
// With a budget attached every evaluation of a trial point costs one
// iteration; an exhausted budget aborts the solver at the last accepted x.
struct LikelihoodGradient {
    const PairwiseTally& tally;
    double log_reference;
    IterationBudget* budget = nullptr;

    int operator()(const Eigen::VectorXd& x, Eigen::VectorXd& grad) const {
        if (budget) {
            if (!budget->canContinue()) return -1;
            budget->recordIteration();
        }
        const Eigen::Index n = x.size();
        for (Eigen::Index i = 0; i < n; i++) {
            const size_t si = static_cast<size_t>(i);
            double expected = kPhantomGames * logistic(x[i] - log_reference);
            for (const auto& [j, n_ij] : tally.opponents[si]) {
                expected += n_ij * logistic(x[i] - x[static_cast<Eigen::Index>(j)]);
            }
            grad[i] = tally.wins[si] + 0.5 * kPhantomGames - expected;
        }
        return 0;
    }

    int df(const Eigen::VectorXd& x, Eigen::MatrixXd& hessian) const {
        const Eigen::Index n = x.size();
        hessian.setZero(n, n);
        for (Eigen::Index i = 0; i < n; i++) {
            const size_t si = static_cast<size_t>(i);
            double q = logistic(x[i] - log_reference);
            double diagonal = -kPhantomGames * q * (1.0 - q);
            for (const auto& [j, n_ij] : tally.opponents[si]) {
                const Eigen::Index ej = static_cast<Eigen::Index>(j);
                double p = logistic(x[i] - x[ej]);
                double curvature = n_ij * p * (1.0 - p);
                diagonal -= curvature;
                hessian(i, ej) += curvature;
            }
            hessian(i, i) += diagonal;
        }
        return 0;
    }
};

} // namespace

SolveResult NewtonDoglegSolver::solve(const LogSnapshot& snapshot) const {
    PairwiseTally tally = PairwiseTally::build(snapshot);
    const Eigen::Index n = static_cast<Eigen::Index>(tally.size());

    SolveResult result;
    result.solver = name();

    IterationBudget budget(config_.max_iterations);
    budget.start();

    // Gradient entries are in units of games; scale the tolerance with them.
    double heaviest = 0.0;
    for (double g : tally.games) heaviest = std::max(heaviest, g);
    const double gradient_tolerance = config_.tolerance * (1.0 + heaviest);

    // gauge measures progress without drawing on the budget.
    const LikelihoodGradient gauge{tally, std::log(kPhantomReference)};
    LikelihoodGradient gradient{tally, std::log(kPhantomReference)};
    Eigen::VectorXd x = Eigen::VectorXd::Zero(n);
    Eigen::VectorXd residual(n);
    double norm = 0.0;

    if (n > 0) {
        gauge(x, residual);
        norm = residual.lpNorm<Eigen::Infinity>();
    }

    if (norm > gradient_tolerance) {
        Eigen::HybridNonLinearSolver<LikelihoodGradient> dogleg(gradient);
        dogleg.parameters.xtol = std::numeric_limits<double>::epsilon();
        dogleg.parameters.maxfev = static_cast<Eigen::Index>(config_.max_iterations) + 1;

        auto status = dogleg.solveInit(x);
        gradient.budget = &budget;
        while (status == Eigen::HybridNonLinearSolverSpace::Running) {
            status = dogleg.solveOneStep(x);
            gauge(x, residual);
            norm = residual.lpNorm<Eigen::Infinity>();
            if (norm <= gradient_tolerance) break;
        }

        // An aborted or stalled run leaves x at the last accepted point.
        gauge(x, residual);
        norm = residual.lpNorm<Eigen::Infinity>();
    }

    std::vector<double> scores(static_cast<size_t>(n));
    for (Eigen::Index i = 0; i < n; i++) {
        scores[static_cast<size_t>(i)] = std::exp(x[i]);
    }
    normalizeGeometricMean(scores);

    result.scores = assembleScores(snapshot, tally, scores);
    result.iterations = budget.iterations();
    result.max_delta = norm;
    result.converged = norm <= gradient_tolerance;
    reportConvergence(result, budget.elapsedSeconds());
    return result;
}

} // namespace pairank
