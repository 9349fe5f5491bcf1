/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GRID_COST_MODEL_HPP
#define GRID_COST_MODEL_HPP

#include "world/TileMap.hpp"

namespace TileNav {

/**
 * @brief Per-tile cost terms layered on top of the unit step cost
 *
 * Both queries read walkability only; out-of-range tiles count as walls.
 */
struct GridCostModel {
    // Walkable tile squeezed between two walls on opposite sides
    static bool isDoorway(const WalkabilityMap& map, int x, int y);

    /**
     * @brief Penalty for standing near walls
     *
     * Blocked cells in the (2r+1)^2 square around (x, y) add 1/distance.
     * The four orthogonal neighbours add a flat ORTHO_WALL_PENALTY instead,
     * or DOORWAY_WALL_PENALTY when (x, y) itself is a doorway. radius is
     * clamped to [0, MAX_PENALTY_RADIUS].
     */
    static float wallPenalty(const WalkabilityMap& map, int x, int y, int radius = 2);

    static constexpr float ORTHO_WALL_PENALTY = 2.0f;
    static constexpr float DOORWAY_WALL_PENALTY = 0.5f;
    static constexpr int MAX_PENALTY_RADIUS = 8;
};

} // namespace TileNav

#endif // GRID_COST_MODEL_HPP
