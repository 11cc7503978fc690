#pragma once

#include <stdexcept>
#include <string>

namespace pairank {

// ─── Error Taxonomy ────────────────────────────────────────────
// Every failure surfaced by the engine derives from RankingError so a
// caller can catch the family, then tell bad input from transient
// infrastructure by the concrete type.

class RankingError : public std::runtime_error {
public:
    explicit RankingError(const std::string& what)
        : std::runtime_error(what) {}

    /// True when repeating the same call later may succeed.
    virtual bool retryable() const { return false; }
};

/// Self-comparison, empty candidate id or malformed winner value.
/// Always raised before anything is written.
class InvalidComparisonError : public RankingError {
public:
    explicit InvalidComparisonError(const std::string& what)
        : RankingError(what) {}
};

/// A candidate expected to exist in the store is absent.
class UnknownCandidateError : public RankingError {
public:
    explicit UnknownCandidateError(const std::string& candidate_id)
        : RankingError("Unknown candidate: " + candidate_id),
          candidate_id_(candidate_id) {}

    const std::string& candidateId() const { return candidate_id_; }

private:
    std::string candidate_id_;
};

/// Database unreachable, locked past the busy timeout, or failing I/O.
class StoreUnavailableError : public RankingError {
public:
    explicit StoreUnavailableError(const std::string& what)
        : RankingError(what) {}

    bool retryable() const override { return true; }
};

// ─── Convergence Warning ───────────────────────────────────────
// Not an exception: the solver hit its iteration budget before the
// tolerance was met. Scores are still usable, just less certain.

struct ConvergenceWarning {
    int iterations = 0;
    double max_delta = 0.0;   // last change between sweeps / gradient norm
    std::string message;
};

} // namespace pairank
