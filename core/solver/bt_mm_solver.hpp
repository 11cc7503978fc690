#pragma once

#include "solver/solver.hpp"

namespace pairank {

// ─── Minorize-Maximize Solver ──────────────────────────────────
// Zermelo / Hunter MM iteration for the Bradley–Terry likelihood:
//
//   s_i <- (W_i + P/2) / ( Σ_j n_ij / (s_i + s_j) + P / (s_i + r) )
//
// with P = kPhantomGames and r the phantom reference strength. After
// each sweep s and r are divided by the geometric mean of s. The update
// is homogeneous of degree one in (s, r), so the rescale keeps the scale
// fixed without moving the fixed point. Standard library only; always
// available.

class MinorizeMaximizeSolver : public Solver {
public:
    explicit MinorizeMaximizeSolver(SolverConfig config = {}) : config_(config) {}

    SolveResult solve(const LogSnapshot& snapshot) const override;

    std::string name() const override { return "bt-mm"; }

    const SolverConfig& config() const { return config_; }

private:
    SolverConfig config_;
};

} // namespace pairank
