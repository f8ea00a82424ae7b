/**
 * @file catalog_validator.hpp
 * @brief fxgate source file.
 */

#pragma once

#include <string>
#include <vector>

#include "fxgate/config/event_catalog.hpp"

namespace fxg {

/**
 * @brief Severity level for catalog validation findings.
 */
enum class ValidationSeverity { Warning, Error };

/**
 * @brief One catalog validation finding.
 */
struct ValidationIssue {
    ValidationSeverity severity = ValidationSeverity::Error;
    std::string message;
};

/**
 * @brief Validates an `EventCatalog` before the engine uses it.
 *
 * Errors cover values outside their documented ranges (probabilities outside
 * [0,1], negative weights, non-positive cooldowns, non-finite numbers).
 * Warnings flag configurations that are legal but can never fire.
 */
class CatalogValidator {
public:
    static std::vector<ValidationIssue> validate(const EventCatalog& catalog);
    static bool hasErrors(const std::vector<ValidationIssue>& issues);
};

} // namespace fxg
