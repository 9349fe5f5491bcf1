/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/StuckDetector.hpp"
#include "core/Logger.hpp"
#include <boost/container/small_vector.hpp>
#include <algorithm>
#include <cstdlib>
#include <format>
#include <limits>

namespace TileNav {

namespace {

constexpr int NEIGHBOR_DX[8] = {-1, 0, 1, -1, 1, -1, 0, 1};
constexpr int NEIGHBOR_DY[8] = {-1, -1, -1, 0, 0, 1, 1, 1};

struct EscapeCandidate {
    TileCoord tile;
    int distance;
};

} // namespace

int StuckDetector::countBlockedNeighbors(const WalkabilityMap& map, int x, int y) {
    int blocked = 0;
    for (int i = 0; i < 8; ++i) {
        if (!map.isWalkable(x + NEIGHBOR_DX[i], y + NEIGHBOR_DY[i])) ++blocked;
    }
    return blocked;
}

bool StuckDetector::isStuck(const WalkabilityMap& map, int x, int y, int stuckThreshold) {
    if (countBlockedNeighbors(map, x, y) >= stuckThreshold) return true;

    // Corner pocket: a wall to one side plus a wall above or below
    for (int sx : {-1, 1}) {
        if (map.isWalkable(x + sx, y)) continue;
        for (int sy : {-1, 1}) {
            if (!map.isWalkable(x, y + sy)) return true;
        }
    }
    return false;
}

bool StuckDetector::findEscapePath(const WalkabilityMap& map, int x, int y,
                                   std::vector<Vector2D>& outPath, int maxDistance,
                                   int stuckThreshold) {
    outPath.clear();
    maxDistance = std::min(maxDistance, MAX_ESCAPE_DISTANCE);

    boost::container::small_vector<EscapeCandidate, 16> openSpaces;
    TileCoord best{x, y};
    bool haveBest = false;
    float bestScore = std::numeric_limits<float>::max();

    auto consider = [&](int cx, int cy, int radius) {
        if (!map.isWalkable(cx, cy)) return;

        int walls = countBlockedNeighbors(map, cx, cy);
        int walkable = 8 - walls;
        if (isStuck(map, cx, cy, stuckThreshold)) return;

        float score = RING_WEIGHT * static_cast<float>(radius) +
                      WALL_WEIGHT * static_cast<float>(walls) -
                      OPEN_WEIGHT * static_cast<float>(walkable);
        if (score < bestScore) {
            bestScore = score;
            best = TileCoord{cx, cy};
            haveBest = true;
        }

        if (walkable >= OPEN_SPACE_MIN_WALKABLE) {
            openSpaces.push_back(EscapeCandidate{TileCoord{cx, cy}, radius});
        }
    };

    for (int radius = 1; radius <= maxDistance; ++radius) {
        for (int dx = -radius; dx <= radius; ++dx) {
            int rest = radius - std::abs(dx);
            consider(x + dx, y - rest, radius);
            if (rest != 0) {
                consider(x + dx, y + rest, radius);
            }
        }
    }

    TileCoord chosen{x, y};
    bool found = false;

    if (!openSpaces.empty()) {
        const EscapeCandidate* nearest = &openSpaces.front();
        for (const auto& candidate : openSpaces) {
            if (candidate.distance < nearest->distance) nearest = &candidate;
        }
        chosen = nearest->tile;
        found = true;
    } else if (haveBest) {
        chosen = best;
        found = true;
    } else {
        // Emergency hop to any immediate neighbour that isn't itself pinned
        for (int i = 0; i < 8 && !found; ++i) {
            int nx = x + NEIGHBOR_DX[i];
            int ny = y + NEIGHBOR_DY[i];
            if (map.isWalkable(nx, ny) && !isStuck(map, nx, ny, stuckThreshold)) {
                chosen = TileCoord{nx, ny};
                found = true;
            }
        }
    }

    if (!found) {
        ESCAPE_WARN(std::format("No escape tile within {} of ({},{})", maxDistance, x, y));
        return false;
    }

    const float tileSize = map.getTileSize();
    outPath.push_back(TileCoord{x, y}.toPixelCenter(tileSize));
    outPath.push_back(chosen.toPixelCenter(tileSize));

    ESCAPE_DEBUG(std::format("Escape from ({},{}) to ({},{})", x, y, chosen.x, chosen.y));
    return true;
}

} // namespace TileNav
