/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef STUCK_DETECTOR_HPP
#define STUCK_DETECTOR_HPP

#include <vector>
#include "utils/Vector2D.hpp"
#include "world/TileMap.hpp"

namespace TileNav {

/**
 * @brief Detects wall-pinned tiles and plans a short hop out of them
 */
struct StuckDetector {
    /**
     * @brief True when (x, y) is boxed in
     *
     * Either at least stuckThreshold of the 8 neighbours are blocked, or one
     * horizontal and one vertical neighbour form a blocked corner pocket.
     */
    static bool isStuck(const WalkabilityMap& map, int x, int y, int stuckThreshold = 3);

    /**
     * @brief Picks a nearby open tile and writes [center(x,y), center(escape)]
     *
     * Candidates are walkable tiles on Manhattan rings 1..maxDistance, with
     * maxDistance clamped to MAX_ESCAPE_DISTANCE. Returns false with an empty
     * outPath when no candidate qualifies.
     *
     * Rings are scanned without a connectivity check, so the escape tile may
     * sit behind a wall. Callers must not treat the hop as a walkable
     * straight-line segment.
     */
    static bool findEscapePath(const WalkabilityMap& map, int x, int y,
                               std::vector<Vector2D>& outPath, int maxDistance = 8,
                               int stuckThreshold = 3);

    // Ring candidates with at least this many walkable neighbours are open space
    static constexpr int OPEN_SPACE_MIN_WALKABLE = 5;
    static constexpr float RING_WEIGHT = 1.0f;
    static constexpr float WALL_WEIGHT = 0.5f;
    static constexpr float OPEN_WEIGHT = 0.3f;
    static constexpr int MAX_ESCAPE_DISTANCE = 64;

private:
    static int countBlockedNeighbors(const WalkabilityMap& map, int x, int y);
};

} // namespace TileNav

#endif // STUCK_DETECTOR_HPP
