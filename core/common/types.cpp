#include "common/types.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cctype>

namespace pairank {

Winner parseWinner(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "a") return Winner::A;
    if (lowered == "b") return Winner::B;
    if (lowered == "tie") return Winner::Tie;
    throw InvalidComparisonError("Invalid winner '" + text + "' (expected a, b or tie)");
}

std::string winnerToString(Winner winner) {
    switch (winner) {
        case Winner::A:   return "a";
        case Winner::B:   return "b";
        case Winner::Tie: return "tie";
    }
    return "tie";
}

const CandidateRecord* LogSnapshot::find(const std::string& id) const {
    for (const auto& c : candidates) {
        if (c.id == id) return &c;
    }
    return nullptr;
}

} // namespace pairank
