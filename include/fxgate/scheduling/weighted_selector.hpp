/**
 * @file weighted_selector.hpp
 * @brief fxgate source file.
 */

#pragma once

#include <optional>
#include <vector>

#include "fxgate/config/event_catalog.hpp"
#include "fxgate/core/event_type.hpp"
#include "fxgate/scheduling/probability_calculator.hpp"
#include "fxgate/scheduling/random_source.hpp"

namespace fxg {

struct SelectionCandidate {
    EventType type = EventType::Glitch;
    double probability = 0.0;
    /// weight * probability
    double effectiveWeight = 0.0;
};

/**
 * @brief Picks at most one event type, weighted by static weight x probability.
 *
 * Selection does not record anything; committing the choice is a separate step.
 */
class WeightedSelector {
public:
    WeightedSelector(const EventCatalog& catalog,
                     ProbabilityCalculator& calculator,
                     IRandomSource& random);

    std::optional<EventType> select(double intensity);

    /**
     * @brief Enabled types with positive effective weight, in catalog order.
     */
    std::vector<SelectionCandidate> candidates(double intensity);

    /**
     * @brief Walk the cumulative weights for a draw `unit` in [0, 1).
     *
     * If rounding leaves the scaled draw at or beyond the total, the last
     * candidate is returned instead of nothing.
     */
    static std::optional<EventType> pick(const std::vector<SelectionCandidate>& candidates, double unit);

private:
    const EventCatalog& catalog_;
    ProbabilityCalculator& calculator_;
    IRandomSource& random_;
};

} // namespace fxg
