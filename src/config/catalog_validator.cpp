#include "fxgate/config/catalog_validator.hpp"

#include <cmath>
#include <sstream>

namespace fxg {
namespace {

std::string describe(EventType type, const char* field, double value, const char* expectation) {
    std::ostringstream os;
    os << "Event '" << toString(type) << "' " << field << " " << value << " " << expectation;
    return os.str();
}

} // namespace

std::vector<ValidationIssue> CatalogValidator::validate(const EventCatalog& catalog) {
    std::vector<ValidationIssue> issues;

    if (catalog.empty()) {
        issues.push_back({ValidationSeverity::Error, "Catalog must contain at least one event type"});
        return issues;
    }

    bool anyEnabled = false;
    for (const auto type : catalog.types()) {
        const auto config = *catalog.find(type);

        if (!std::isfinite(config.baseChance) || config.baseChance < 0.0 || config.baseChance > 1.0) {
            issues.push_back({ValidationSeverity::Error,
                              describe(type, "baseChance", config.baseChance, "outside [0, 1]")});
        }
        if (!std::isfinite(config.intensityMultiplier) || config.intensityMultiplier < 0.0) {
            issues.push_back({ValidationSeverity::Error,
                              describe(type, "intensityMultiplier", config.intensityMultiplier,
                                       "must be >= 0")});
        }
        if (!std::isfinite(config.cooldownSeconds) || config.cooldownSeconds <= 0.0) {
            issues.push_back({ValidationSeverity::Error,
                              describe(type, "cooldownSeconds", config.cooldownSeconds, "must be > 0")});
        }
        if (!std::isfinite(config.weight) || config.weight < 0.0) {
            issues.push_back({ValidationSeverity::Error,
                              describe(type, "weight", config.weight, "must be >= 0")});
        }

        if (!config.enabled) {
            continue;
        }
        anyEnabled = true;
        if (config.weight == 0.0 || config.baseChance == 0.0) {
            issues.push_back({ValidationSeverity::Warning,
                              std::string("Event '") + toString(type) + "' is enabled but can never be selected"});
        }
    }

    if (!anyEnabled) {
        issues.push_back({ValidationSeverity::Warning, "No event type is enabled"});
    }

    return issues;
}

bool CatalogValidator::hasErrors(const std::vector<ValidationIssue>& issues) {
    for (const auto& issue : issues) {
        if (issue.severity == ValidationSeverity::Error) {
            return true;
        }
    }
    return false;
}

} // namespace fxg
