/**
 * @file catalog_loader.hpp
 * @brief fxgate source file.
 */

#pragma once

#include <string>

#include "fxgate/config/event_catalog.hpp"

namespace fxg {

/**
 * @brief Applies event tuning overrides from a JSON document.
 *
 * Expected shape:
 * @code
 * { "events": [
 *   { "type": "glitch", "baseChance": 0.25, "cooldownSeconds": 90, "enabled": true },
 *   { "type": "easter_egg", "baseChance": 0.02, "cooldownSeconds": 600, "maxPerSession": 1 }
 * ] }
 * @endcode
 *
 * Fields missing from an entry keep the value already in the catalog; types
 * not yet in the catalog start from `EventTypeConfig{}`. The merged catalog
 * is validated and only assigned to `inOutCatalog` when it has no errors.
 */
class CatalogLoader {
public:
    static bool loadFromJsonFile(const std::string& filePath,
                                 EventCatalog& inOutCatalog,
                                 std::string& outError);

    static bool loadFromJsonText(const std::string& json,
                                 EventCatalog& inOutCatalog,
                                 std::string& outError);
};

} // namespace fxg
