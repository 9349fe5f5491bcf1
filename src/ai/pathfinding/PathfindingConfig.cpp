/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/PathfindingConfig.hpp"
#include "ai/pathfinding/GridCostModel.hpp"
#include "ai/pathfinding/StuckDetector.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <cmath>
#include <format>
#include <limits>

namespace TileNav {

namespace {

// Integer setting in [minValue, maxValue]; anything else keeps the old value
template <typename IntT>
void readInt(const char* sectionName, const std::string& key,
             const JsonValue& value, IntT& field, long long minValue,
             long long maxValue = std::numeric_limits<int>::max()) {
    auto number = value.tryAsNumber();
    if (!number || std::floor(*number) != *number) {
        CONFIG_WARN(std::format("'{}.{}' must be an integer, keeping {}", sectionName, key, field));
        return;
    }
    if (*number < static_cast<double>(minValue) || *number > static_cast<double>(maxValue)) {
        CONFIG_WARN(std::format("'{}.{}' = {} out of range [{}, {}], keeping {}",
                    sectionName, key, *number, minValue, maxValue, field));
        return;
    }
    field = static_cast<IntT>(*number);
}

// Float setting; strictlyPositive rejects zero as well as negatives
void readFloat(const char* sectionName, const std::string& key, const JsonValue& value,
               float& field, bool strictlyPositive) {
    auto number = value.tryAsNumber();
    if (!number) {
        CONFIG_WARN(std::format("'{}.{}' must be a number, keeping {}", sectionName, key, field));
        return;
    }
    bool bad = strictlyPositive ? !(*number > 0.0) : !(*number >= 0.0);
    if (bad || !std::isfinite(*number)) {
        CONFIG_WARN(std::format("'{}.{}' = {} must be {}, keeping {}", sectionName, key, *number,
                    strictlyPositive ? "positive" : "non-negative", field));
        return;
    }
    field = static_cast<float>(*number);
}

} // namespace

bool PathfindingConfig::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        CONFIG_ERROR("Failed to load pathfinding config: " + filepath + " - " + reader.getLastError());
        return false;
    }

    const JsonValue& root = reader.getRoot();
    if (!root.isObject()) {
        CONFIG_ERROR("Pathfinding config root is not a JSON object: " + filepath);
        return false;
    }

    for (const auto& [sectionName, section] : root.asObject()) {
        if (!section.isObject()) {
            CONFIG_WARN("Section '" + sectionName + "' is not an object, skipping");
            continue;
        }

        if (sectionName == "pathfinding") {
            applyPathfinding(section);
        } else if (sectionName == "pursuit") {
            applyPursuit(section);
        } else {
            CONFIG_WARN("Unknown section '" + sectionName + "', ignoring");
        }
    }

    CONFIG_INFO("Loaded pathfinding config from file: " + filepath);
    return true;
}

void PathfindingConfig::applyPathfinding(const JsonValue& section) {
    constexpr const char* name = "pathfinding";
    constexpr long long intMin = std::numeric_limits<int>::min();

    for (const auto& [key, value] : section.asObject()) {
        if (key == "maxPathLength") {
            readInt(name, key, value, maxPathLength, intMin);
        } else if (key == "wallClearance") {
            readFloat(name, key, value, wallClearance, false);
        } else if (key == "doorwayClearance") {
            readFloat(name, key, value, doorwayClearance, false);
        } else if (key == "maxExpansions") {
            readInt(name, key, value, maxExpansions, 1);
        } else if (key == "wallPenaltyRadius") {
            readInt(name, key, value, wallPenaltyRadius, 0, GridCostModel::MAX_PENALTY_RADIUS);
        } else if (key == "stuckThreshold") {
            readInt(name, key, value, stuckThreshold, 1, 8);
        } else if (key == "escapeMaxDistance") {
            readInt(name, key, value, escapeMaxDistance, 1, StuckDetector::MAX_ESCAPE_DISTANCE);
        } else if (key == "simplifyTolerance") {
            readFloat(name, key, value, simplifyTolerance, false);
        } else {
            CONFIG_WARN(std::format("Unknown setting '{}.{}', ignoring", name, key));
        }
    }
}

void PathfindingConfig::applyPursuit(const JsonValue& section) {
    constexpr const char* name = "pursuit";

    for (const auto& [key, value] : section.asObject()) {
        if (key == "chaseRangeTiles") {
            readInt(name, key, value, chaseRangeTiles, 1);
        } else if (key == "chaseSpeed") {
            readFloat(name, key, value, chaseSpeed, true);
        } else if (key == "repathIntervalMs") {
            readInt(name, key, value, repathIntervalMs, 0);
        } else if (key == "waypointRadius") {
            readFloat(name, key, value, waypointRadius, true);
        } else {
            CONFIG_WARN(std::format("Unknown setting '{}.{}', ignoring", name, key));
        }
    }
}

bool PathfindingConfig::isValid() const {
    return wallClearance >= 0.0f && doorwayClearance >= 0.0f && maxExpansions > 0 &&
           wallPenaltyRadius >= 0 && wallPenaltyRadius <= GridCostModel::MAX_PENALTY_RADIUS &&
           stuckThreshold >= 1 && stuckThreshold <= 8 && escapeMaxDistance > 0 &&
           escapeMaxDistance <= StuckDetector::MAX_ESCAPE_DISTANCE &&
           simplifyTolerance >= 0.0f && chaseRangeTiles > 0 && chaseSpeed > 0.0f &&
           waypointRadius > 0.0f;
}

} // namespace TileNav
