#include "solver/solver.hpp"
#include "solver/bt_mm_solver.hpp"
#include "logging/log.hpp"

#ifdef PAIRANK_HAVE_EIGEN
#include "solver/newton_dogleg_solver.hpp"
#endif

namespace pairank {

std::string solverKindName(SolverKind kind) {
    switch (kind) {
        case SolverKind::Auto:             return "auto";
        case SolverKind::MinorizeMaximize: return "bt-mm";
        case SolverKind::Optimizer:        return "newton-dogleg";
    }
    return "unknown";
}

bool optimizerAvailable() {
#ifdef PAIRANK_HAVE_EIGEN
    return true;
#else
    return false;
#endif
}

std::vector<SolverKind> availableSolverKinds() {
    std::vector<SolverKind> kinds{SolverKind::MinorizeMaximize};
    if (optimizerAvailable()) kinds.push_back(SolverKind::Optimizer);
    return kinds;
}

std::unique_ptr<Solver> makeSolver(SolverKind kind, const SolverConfig& config) {
    if (config.max_iterations <= 0 || !(config.tolerance > 0.0)) {
        throw RankingError("Solver needs a positive tolerance and iteration budget");
    }
    if (kind == SolverKind::Auto) {
        kind = optimizerAvailable() ? SolverKind::Optimizer : SolverKind::MinorizeMaximize;
    }

    switch (kind) {
        case SolverKind::MinorizeMaximize:
            return std::make_unique<MinorizeMaximizeSolver>(config);
        case SolverKind::Optimizer:
#ifdef PAIRANK_HAVE_EIGEN
            return std::make_unique<NewtonDoglegSolver>(config);
#else
            throw RankingError("Optimizer solver requested but pairank was built without Eigen");
#endif
        case SolverKind::Auto:
            break;
    }
    throw RankingError("Unhandled solver kind: " + solverKindName(kind));
}

void reportConvergence(SolveResult& result, double elapsed_seconds) {
    if (result.converged) {
        PAIRANK_LOG_DEBUG("{} converged after {} iterations ({:.3f}s, delta {:.3g})",
                          result.solver, result.iterations, elapsed_seconds, result.max_delta);
        return;
    }

    ConvergenceWarning warning;
    warning.iterations = result.iterations;
    warning.max_delta = result.max_delta;
    warning.message = result.solver + " stopped after " + std::to_string(result.iterations) +
                      " iterations without reaching tolerance (last delta " +
                      std::to_string(result.max_delta) + ")";
    PAIRANK_LOG_WARN("{}", warning.message);
    result.warning = std::move(warning);
}

} // namespace pairank
