/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATHFINDING_CONFIG_HPP
#define PATHFINDING_CONFIG_HPP

#include <string>

namespace TileNav {

class JsonValue;

/**
 * @brief Tunables for the search and for PursuitController
 *
 * Defaults reproduce the stock chase behaviour. loadFromFile() overlays a
 * JSON document of the form:
 *
 *   { "pathfinding": { "maxExpansions": 500, ... },
 *     "pursuit":     { "chaseSpeed": 120.0, ... } }
 *
 * Keys missing from the file keep their current value.
 */
struct PathfindingConfig {
    // Search
    int maxPathLength{20};         // waypoints kept after smoothing, <= 0 keeps all
    float wallClearance{1.5f};     // tiles
    float doorwayClearance{0.5f};  // tiles
    int maxExpansions{500};
    int wallPenaltyRadius{2};      // 0..8
    int stuckThreshold{3};         // blocked neighbours (of 8)
    int escapeMaxDistance{8};      // Manhattan rings, 1..64
    float simplifyTolerance{1.0f};

    // Pursuit
    int chaseRangeTiles{5};
    float chaseSpeed{120.0f};       // pixels per second
    unsigned int repathIntervalMs{1000};
    float waypointRadius{0.25f};    // fraction of a tile

    // Returns false and leaves every field untouched when the file can't be
    // read or isn't a JSON object.
    bool loadFromFile(const std::string& filepath);

    bool isValid() const;

private:
    void applyPathfinding(const JsonValue& section);
    void applyPursuit(const JsonValue& section);
};

} // namespace TileNav

#endif // PATHFINDING_CONFIG_HPP
