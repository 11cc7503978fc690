#pragma once

#include "solver/solver.hpp"

namespace pairank {

// ─── Newton-Dogleg Solver ──────────────────────────────────────
// Maximizes the damped Bradley–Terry log-likelihood directly
//
//   L(x) = Σ_comparisons [ x_winner − log(e^x_a + e^x_b) ]
//        + Σ_i P · [ x_i / 2 − log(e^x_i + r) ]
//
// over log-strengths x_i = log s_i, which keeps every score positive.
// L is strictly concave, so its gradient has a single root; Eigen's
// Powell hybrid (dogleg) solver finds it using the analytic Hessian as
// Jacobian. The root is the fixed point of the MM iteration, reached in
// far fewer steps. Built only when Eigen is available.

class NewtonDoglegSolver : public Solver {
public:
    explicit NewtonDoglegSolver(SolverConfig config = {}) : config_(config) {}

    SolveResult solve(const LogSnapshot& snapshot) const override;

    std::string name() const override { return "newton-dogleg"; }

    const SolverConfig& config() const { return config_; }

private:
    SolverConfig config_;
};

} // namespace pairank
