#include "fxgate/scheduling/weighted_selector.hpp"

namespace fxg {

WeightedSelector::WeightedSelector(const EventCatalog& catalog,
                                   ProbabilityCalculator& calculator,
                                   IRandomSource& random)
    : catalog_(catalog), calculator_(calculator), random_(random) {}

std::optional<EventType> WeightedSelector::select(double intensity) {
    const auto eligible = candidates(intensity);
    if (eligible.empty()) {
        return std::nullopt;
    }
    return pick(eligible, random_.nextUnit());
}

std::vector<SelectionCandidate> WeightedSelector::candidates(double intensity) {
    std::vector<SelectionCandidate> out;
    for (const auto type : catalog_.types()) {
        const auto config = catalog_.find(type);
        if (!config || !config->enabled) {
            continue;
        }
        const auto p = calculator_.probability(type, intensity);
        const auto weight = config->weight * p;
        if (p > 0.0 && weight > 0.0) {
            out.push_back({type, p, weight});
        }
    }
    return out;
}

std::optional<EventType> WeightedSelector::pick(const std::vector<SelectionCandidate>& candidates, double unit) {
    double total = 0.0;
    for (const auto& c : candidates) {
        total += c.effectiveWeight;
    }
    if (candidates.empty() || !(total > 0.0)) {
        return std::nullopt;
    }

    const auto draw = unit * total;
    double cumulative = 0.0;
    for (const auto& c : candidates) {
        cumulative += c.effectiveWeight;
        if (draw < cumulative) {
            return c.type;
        }
    }
    return candidates.back().type;
}

} // namespace fxg
