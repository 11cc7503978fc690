#include "solver/pairwise_tally.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>

namespace pairank {

PairwiseTally PairwiseTally::build(const LogSnapshot& snapshot) {
    std::map<std::string, size_t> index;
    for (const auto& c : snapshot.comparisons) {
        index.emplace(c.candidate_a, 0);
        index.emplace(c.candidate_b, 0);
    }

    PairwiseTally tally;
    tally.ids.reserve(index.size());
    for (auto& [id, slot] : index) {
        slot = tally.ids.size();
        tally.ids.push_back(id);
    }

    const size_t n = tally.ids.size();
    tally.wins.assign(n, 0.0);
    tally.games.assign(n, 0.0);
    std::vector<std::map<size_t, double>> pair_counts(n);

    for (const auto& c : snapshot.comparisons) {
        size_t a = index.at(c.candidate_a);
        size_t b = index.at(c.candidate_b);
        switch (c.winner) {
            case Winner::A:
                tally.wins[a] += 1.0;
                break;
            case Winner::B:
                tally.wins[b] += 1.0;
                break;
            case Winner::Tie:
                tally.wins[a] += 0.5;
                tally.wins[b] += 0.5;
                break;
        }
        tally.games[a] += 1.0;
        tally.games[b] += 1.0;
        pair_counts[a][b] += 1.0;
        pair_counts[b][a] += 1.0;
    }

    tally.opponents.resize(n);
    for (size_t i = 0; i < n; i++) {
        tally.opponents[i].assign(pair_counts[i].begin(), pair_counts[i].end());
    }
    return tally;
}

double normalizeGeometricMean(std::vector<double>& scores, double* reference) {
    if (scores.empty()) return 1.0;

    double log_sum = 0.0;
    for (double s : scores) log_sum += std::log(s);
    double factor = std::exp(log_sum / static_cast<double>(scores.size()));

    for (double& s : scores) s /= factor;
    if (reference) *reference /= factor;
    return factor;
}

void snapNearTies(std::vector<double>& scores) {
    std::vector<size_t> order(scores.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(),
              [&scores](size_t a, size_t b) { return scores[a] < scores[b]; });

    // Runs are grown from their smallest member. A run that reaches the
    // default score takes it, so active ties line up with idle candidates.
    size_t run_start = 0;
    while (run_start < order.size()) {
        const double anchor = scores[order[run_start]];
        size_t run_end = run_start + 1;
        while (run_end < order.size() &&
               scores[order[run_end]] - anchor <= kScoreTieRelative * anchor) {
            run_end++;
        }

        double common = anchor;
        if (std::abs(scores[order[run_end - 1]] - kDefaultScore) <= kScoreTieRelative &&
            std::abs(anchor - kDefaultScore) <= kScoreTieRelative) {
            common = kDefaultScore;
        }
        for (size_t k = run_start; k < run_end; k++) {
            scores[order[k]] = common;
        }
        run_start = run_end;
    }
}

ScoreMap assembleScores(const LogSnapshot& snapshot,
                        const PairwiseTally& tally,
                        const std::vector<double>& active_scores) {
    std::vector<double> snapped = active_scores;
    snapNearTies(snapped);

    ScoreMap scores;
    scores.reserve(snapshot.candidates.size() + tally.size());
    for (const auto& c : snapshot.candidates) {
        scores[c.id] = kDefaultScore;
    }
    for (size_t i = 0; i < tally.size(); i++) {
        scores[tally.ids[i]] = snapped[i];
    }
    return scores;
}

} // namespace pairank
