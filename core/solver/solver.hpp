#pragma once

#include "common/errors.hpp"
#include "common/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pairank {

struct SolverConfig {
    double tolerance = 1e-9;     // max score change between sweeps
    int max_iterations = 10000;  // hard bound on solver runtime
};

/// Scores for every candidate in the snapshot plus how the run ended.
struct SolveResult {
    ScoreMap scores;
    int iterations = 0;
    double max_delta = 0.0;
    bool converged = true;
    std::string solver;
    std::optional<ConvergenceWarning> warning;
};

// ─── Solver ────────────────────────────────────────────────────
// Maximum-likelihood Bradley–Terry strengths from a comparison log,
// P(i beats j) = s_i / (s_i + s_j), damped by one half-won phantom
// comparison per active candidate. Results are rescaled so the scores
// of candidates with games have geometric mean 1; candidates without
// games keep kDefaultScore.

class Solver {
public:
    virtual ~Solver() = default;

    virtual SolveResult solve(const LogSnapshot& snapshot) const = 0;

    virtual std::string name() const = 0;
};

enum class SolverKind {
    Auto,               // optimizer when built in, MM otherwise
    MinorizeMaximize,
    Optimizer
};

std::string solverKindName(SolverKind kind);

/// True when pairank was built with the Eigen-backed optimizer.
bool optimizerAvailable();

/// Concrete kinds usable in this build (never Auto).
std::vector<SolverKind> availableSolverKinds();

/// Throws RankingError when the requested kind is not built in.
std::unique_ptr<Solver> makeSolver(SolverKind kind = SolverKind::Auto,
                                   const SolverConfig& config = {});

/// Flag a run that ended on its budget and log the outcome.
void reportConvergence(SolveResult& result, double elapsed_seconds);

} // namespace pairank
