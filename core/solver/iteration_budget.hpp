#pragma once

#include <chrono>

namespace pairank {

/// Hard upper bound on solver work.
/// Counts sweeps (MM) or solver steps (optimizer); wall-clock time is
/// only tracked for reporting.
class IterationBudget {
public:
    explicit IterationBudget(int max_iterations)
        : max_iterations_(max_iterations) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        iterations_ = 0;
    }

    void recordIteration() { iterations_++; }

    bool canContinue() const { return iterations_ < max_iterations_; }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    int iterations() const { return iterations_; }
    int maxIterations() const { return max_iterations_; }
    bool isExhausted() const { return iterations_ >= max_iterations_; }

private:
    int max_iterations_;
    int iterations_ = 0;
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
};

} // namespace pairank
