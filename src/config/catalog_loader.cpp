/**
 * @file catalog_loader.cpp
 * @brief fxgate source file.
 */

#include "fxgate/config/catalog_loader.hpp"

#include <fstream>
#include <limits>
#include <regex>
#include <sstream>
#include <stdexcept>

#include "fxgate/config/catalog_validator.hpp"

namespace fxg {
namespace {

bool readFile(const std::string& path, std::string& out, std::string& outError) {
    std::ifstream file(path);
    if (!file) {
        outError = "Cannot open file: " + path;
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

std::optional<std::string> field(const std::string& object, const std::string& key,
                                 const std::string& valuePattern) {
    std::regex re("\"" + key + "\"\\s*:\\s*" + valuePattern, std::regex_constants::icase);
    std::smatch match;
    if (!std::regex_search(object, match, re) || match.size() < 2) {
        return std::nullopt;
    }
    return match[1].str();
}

std::optional<double> numberField(const std::string& object, const std::string& key) {
    const auto text = field(object, key, "\"?([-+]?[0-9]*\\.?[0-9]+(?:[eE][-+]?[0-9]+)?)\"?");
    if (!text) {
        return std::nullopt;
    }
    std::size_t consumed = 0;
    const double value = std::stod(*text, &consumed);
    if (consumed != text->size()) {
        throw std::invalid_argument("invalid numeric value for " + key);
    }
    return value;
}

std::optional<bool> boolField(const std::string& object, const std::string& key) {
    const auto text = field(object, key, "\"?(true|false)\"?");
    if (!text) {
        return std::nullopt;
    }
    return *text == "true" || *text == "TRUE" || *text == "True";
}

std::uint32_t toSessionCap(double value) {
    if (value < 0.0 || value > static_cast<double>(std::numeric_limits<std::uint32_t>::max()) ||
        value != static_cast<double>(static_cast<std::uint64_t>(value))) {
        throw std::invalid_argument("maxPerSession must be a non-negative integer");
    }
    return static_cast<std::uint32_t>(value);
}

} // namespace

bool CatalogLoader::loadFromJsonFile(const std::string& filePath,
                                     EventCatalog& inOutCatalog,
                                     std::string& outError) {
    outError.clear();
    std::string json;
    if (!readFile(filePath, json, outError)) {
        return false;
    }
    return loadFromJsonText(json, inOutCatalog, outError);
}

bool CatalogLoader::loadFromJsonText(const std::string& json,
                                     EventCatalog& inOutCatalog,
                                     std::string& outError) {
    outError.clear();
    EventCatalog merged = inOutCatalog;

    try {
        // Minimal JSON extraction by regex: one flat object per event entry.
        std::regex entryRe("\\{[^\\{\\}]*\"type\"\\s*:\\s*\"([^\"]+)\"[^\\{\\}]*\\}",
                           std::regex_constants::icase);

        bool foundAny = false;
        for (std::sregex_iterator it(json.begin(), json.end(), entryRe), end; it != end; ++it) {
            const auto object = it->str();
            const auto typeText = (*it)[1].str();
            const auto type = parseEventType(typeText);
            if (!type) {
                outError = "Unknown event type: " + typeText;
                return false;
            }

            EventTypeConfigUpdate update;
            update.baseChance = numberField(object, "baseChance");
            update.intensityMultiplier = numberField(object, "intensityMultiplier");
            update.cooldownSeconds = numberField(object, "cooldownSeconds");
            if (const auto cap = numberField(object, "maxPerSession")) {
                update.maxPerSession = toSessionCap(*cap);
            }
            update.weight = numberField(object, "weight");
            update.enabled = boolField(object, "enabled");

            auto config = merged.find(*type).value_or(EventTypeConfig{});
            update.applyTo(config);
            merged.upsert(*type, config);
            foundAny = true;
        }

        if (!foundAny) {
            outError = "No event entries found";
            return false;
        }
    } catch (const std::exception& ex) {
        outError = std::string("Catalog parse error: ") + ex.what();
        return false;
    }

    const auto issues = CatalogValidator::validate(merged);
    if (CatalogValidator::hasErrors(issues)) {
        std::ostringstream os;
        os << "Catalog invalid:";
        for (const auto& issue : issues) {
            if (issue.severity == ValidationSeverity::Error) {
                os << " " << issue.message << ";";
            }
        }
        outError = os.str();
        return false;
    }

    inOutCatalog = std::move(merged);
    return true;
}

} // namespace fxg
