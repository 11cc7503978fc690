#include "selector/comparison_selector.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_set>

namespace pairank {

OpponentCounts OpponentCounts::fromBudget(int total_comparisons) {
    OpponentCounts counts;
    counts.random = std::max(1, total_comparisons * 3 / 10);
    counts.quartile = std::min(4, std::max(1, total_comparisons * 4 / 10));
    counts.neighbors = std::max(1, total_comparisons - counts.random - counts.quartile);
    return counts;
}

std::vector<const CandidateRecord*> ComparisonSelector::pool(const std::string& target,
                                                             const LogSnapshot& snapshot) const {
    std::unordered_set<std::string> met;
    if (config_.skip_compared) {
        for (const auto& c : snapshot.comparisons) {
            if (c.candidate_a == target) met.insert(c.candidate_b);
            if (c.candidate_b == target) met.insert(c.candidate_a);
        }
    }

    std::vector<const CandidateRecord*> eligible;
    eligible.reserve(snapshot.candidates.size());
    for (const auto& c : snapshot.candidates) {
        if (c.id == target || met.count(c.id)) continue;
        eligible.push_back(&c);
    }

    std::sort(eligible.begin(), eligible.end(),
              [](const CandidateRecord* a, const CandidateRecord* b) {
                  if (a->score != b->score) return a->score > b->score;
                  return a->id < b->id;
              });
    return eligible;
}

// ─── Phase 1 ───────────────────────────────────────────────────

std::vector<std::string> ComparisonSelector::explore(const std::string& target,
                                                     const LogSnapshot& snapshot,
                                                     const OpponentCounts& counts,
                                                     SelectorRng& rng) const {
    auto ranked = pool(target, snapshot);
    const size_t n = ranked.size();
    const size_t n_random = static_cast<size_t>(std::max(0, counts.random));
    const size_t n_quartile = static_cast<size_t>(std::max(0, counts.quartile));

    std::vector<std::string> result;
    if (n <= n_random + n_quartile) {
        for (const auto* c : ranked) result.push_back(c->id);
        return result;
    }

    std::vector<bool> taken(n, false);

    // Partial Fisher–Yates over ranking positions.
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    for (size_t k = 0; k < n_random; k++) {
        std::uniform_int_distribution<size_t> dist(k, n - 1);
        std::swap(order[k], order[dist(rng)]);
        taken[order[k]] = true;
        result.push_back(ranked[order[k]]->id);
    }

    // Positions 0, n/q, 2n/q, ... of the ranking: the top, then the
    // quantiles below it. A taken slot moves to the nearest free one.
    for (size_t k = 0; k < n_quartile; k++) {
        size_t wanted = k * n / n_quartile;
        for (size_t offset = 0; offset < n; offset++) {
            if (wanted + offset < n && !taken[wanted + offset]) {
                wanted += offset;
                break;
            }
            if (offset <= wanted && !taken[wanted - offset]) {
                wanted -= offset;
                break;
            }
        }
        taken[wanted] = true;
        result.push_back(ranked[wanted]->id);
    }

    return result;
}

// ─── Phase 2 ───────────────────────────────────────────────────

std::vector<std::string> ComparisonSelector::refine(const std::string& target,
                                                    const LogSnapshot& snapshot,
                                                    const OpponentCounts& counts) const {
    const CandidateRecord* self = snapshot.find(target);
    if (!self) throw UnknownCandidateError(target);

    auto ranked = pool(target, snapshot);
    const double anchor = std::log(self->score);

    std::stable_sort(ranked.begin(), ranked.end(),
                     [anchor](const CandidateRecord* a, const CandidateRecord* b) {
                         double da = std::abs(std::log(a->score) - anchor);
                         double db = std::abs(std::log(b->score) - anchor);
                         if (da != db) return da < db;
                         return a->id < b->id;
                     });

    const size_t take = std::min(ranked.size(),
                                 static_cast<size_t>(std::max(0, counts.neighbors)));
    std::vector<std::string> result;
    result.reserve(take);
    for (size_t i = 0; i < take; i++) {
        result.push_back(ranked[i]->id);
    }
    return result;
}

std::vector<std::string> ComparisonSelector::select(const std::string& target,
                                                    const LogSnapshot& snapshot,
                                                    const OpponentCounts& counts,
                                                    SelectionPhase phase,
                                                    SelectorRng& rng) const {
    switch (phase) {
        case SelectionPhase::Exploration:
            return explore(target, snapshot, counts, rng);
        case SelectionPhase::Refinement:
            return refine(target, snapshot, counts);
    }
    return {};
}

} // namespace pairank
