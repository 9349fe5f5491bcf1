/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/GridCostModel.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace TileNav {

bool GridCostModel::isDoorway(const WalkabilityMap& map, int x, int y) {
    if (!map.isWalkable(x, y)) return false;

    bool eastWest = !map.isWalkable(x + 1, y) && !map.isWalkable(x - 1, y);
    bool northSouth = !map.isWalkable(x, y - 1) && !map.isWalkable(x, y + 1);
    return eastWest || northSouth;
}

float GridCostModel::wallPenalty(const WalkabilityMap& map, int x, int y, int radius) {
    const bool doorway = isDoorway(map, x, y);
    const float orthoPenalty = doorway ? DOORWAY_WALL_PENALTY : ORTHO_WALL_PENALTY;

    radius = std::clamp(radius, 0, MAX_PENALTY_RADIUS);

    float penalty = 0.0f;
    for (int dy = -radius; dy <= radius; ++dy) {
        for (int dx = -radius; dx <= radius; ++dx) {
            if (dx == 0 && dy == 0) continue;
            if (map.isWalkable(x + dx, y + dy)) continue;

            if (std::abs(dx) + std::abs(dy) == 1) {
                penalty += orthoPenalty;
            } else {
                penalty += 1.0f / std::sqrt(static_cast<float>(dx * dx + dy * dy));
            }
        }
    }
    return penalty;
}

} // namespace TileNav
