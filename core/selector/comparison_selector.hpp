#pragma once

#include "common/types.hpp"

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace pairank {

using SelectorRng = std::mt19937_64;

/// How many opponents each selection rule contributes.
struct OpponentCounts {
    int random = 3;      // Phase 1: uniform draws, keep the graph connected
    int quartile = 4;    // Phase 1: rank-quantile representatives
    int neighbors = 3;   // Phase 2: closest current scores

    /// Split a total comparison budget: 30% random, 40% quartile (at
    /// most 4), the rest neighbors; every rule gets at least one.
    static OpponentCounts fromBudget(int total_comparisons);
};

enum class SelectionPhase {
    Exploration,   // before the candidate has been judged
    Refinement     // after Phase 1 results were scored
};

struct SelectorConfig {
    bool skip_compared = true;   // leave out opponents already met
};

// ─── Comparison Selector ───────────────────────────────────────
// Chooses which existing candidates a (usually new) target should be
// judged against. Phase 1 places the target roughly: random opponents
// keep the comparison graph connected, quartile representatives span
// the ranking. Phase 2 refines among the candidates scored closest to
// the target. Output never contains the target or a duplicate and
// depends only on the snapshot, the counts and the generator state.

class ComparisonSelector {
public:
    explicit ComparisonSelector(SelectorConfig config = {}) : config_(config) {}

    /// Phase 1. When the pool holds no more than random + quartile
    /// candidates, returns all of them in ranking order.
    std::vector<std::string> explore(const std::string& target,
                                     const LogSnapshot& snapshot,
                                     const OpponentCounts& counts,
                                     SelectorRng& rng) const;

    /// Phase 2. Throws UnknownCandidateError if the target has no row.
    std::vector<std::string> refine(const std::string& target,
                                    const LogSnapshot& snapshot,
                                    const OpponentCounts& counts) const;

    std::vector<std::string> select(const std::string& target,
                                    const LogSnapshot& snapshot,
                                    const OpponentCounts& counts,
                                    SelectionPhase phase,
                                    SelectorRng& rng) const;

    /// Eligible opponents in ranking order (score desc, id asc).
    std::vector<const CandidateRecord*> pool(const std::string& target,
                                             const LogSnapshot& snapshot) const;

    const SelectorConfig& config() const { return config_; }

private:
    SelectorConfig config_;
};

} // namespace pairank
