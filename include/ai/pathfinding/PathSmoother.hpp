/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATH_SMOOTHER_HPP
#define PATH_SMOOTHER_HPP

#include <vector>
#include "utils/Vector2D.hpp"
#include "world/TileMap.hpp"

namespace TileNav {

/**
 * @brief Waypoint reduction passes
 *
 * Both passes keep the first and last waypoint and return their input
 * unchanged when it has two or fewer points. Running either pass on its own
 * output changes nothing.
 */
struct PathSmoother {
    // Greedy line-of-sight reduction; keeps the furthest waypoint whose
    // straight segment stays clear of walls.
    static std::vector<Vector2D> optimizePath(const WalkabilityMap& map,
                                              const std::vector<Vector2D>& path,
                                              float wallClearance,
                                              float doorwayClearance = 0.5f);

    // Map-independent distance-threshold reduction
    static std::vector<Vector2D> simplifyPath(const std::vector<Vector2D>& path,
                                              float tolerance = 1.0f);

    static bool isSegmentClear(const WalkabilityMap& map, const Vector2D& from,
                               const Vector2D& to, float wallClearance,
                               float doorwayClearance);
};

} // namespace TileNav

#endif // PATH_SMOOTHER_HPP
