#pragma once

#include "common/types.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace pairank {

// ─── Phantom Comparison ────────────────────────────────────────
// Every active candidate plays kPhantomGames extra comparisons against
// a reference opponent of strength kPhantomReference and wins half of
// them. Same constant for every candidate, fixed for the life of the
// library. Keeps unanimous records finite and anchors components of the
// comparison graph that never met each other.

constexpr double kPhantomGames = 1.0;
constexpr double kPhantomReference = 1.0;

// ─── Pairwise Tally ────────────────────────────────────────────
// Sufficient statistics of the comparison log for the Bradley–Terry
// likelihood. Only candidates with at least one comparison are active;
// they are indexed in candidate-id order so every solver sees the same
// layout for the same log.

struct PairwiseTally {
    std::vector<std::string> ids;
    std::vector<double> wins;    // W_i, a tie counts as half a win
    std::vector<double> games;   // real comparisons of i

    /// opponents[i] = (j, n_ij) for every j that met i, sorted by j.
    std::vector<std::vector<std::pair<size_t, double>>> opponents;

    size_t size() const { return ids.size(); }

    static PairwiseTally build(const LogSnapshot& snapshot);
};

/// Divide scores (and *reference, if given) by their geometric mean.
/// Returns the factor that was divided out.
double normalizeGeometricMean(std::vector<double>& scores, double* reference = nullptr);

/// Relative gap below which two scores are treated as the same strength.
/// Far under any solver tolerance, far above accumulated rounding error.
constexpr double kScoreTieRelative = 1e-10;

/// Give scores within kScoreTieRelative of each other one common value
/// (the smallest of the run, or kDefaultScore when the whole run is that
/// close to it), so equal records compare equal exactly.
void snapNearTies(std::vector<double>& scores);

/// Scores for every candidate of the snapshot: active candidates from
/// active_scores (indexed like tally.ids, near-ties snapped), everyone
/// else kDefaultScore.
ScoreMap assembleScores(const LogSnapshot& snapshot,
                        const PairwiseTally& tally,
                        const std::vector<double>& active_scores);

} // namespace pairank
