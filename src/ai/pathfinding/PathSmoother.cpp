/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/PathSmoother.hpp"
#include "ai/pathfinding/GridCostModel.hpp"
#include <algorithm>
#include <cmath>

namespace TileNav {

namespace {

bool isSampleClear(const WalkabilityMap& map, const Vector2D& sample, float tileSize,
                   float wallClearance, float doorwayClearance) {
    TileCoord tile = TileCoord::fromPixel(sample, tileSize);
    if (!map.isWalkable(tile)) return false;

    const float clearance = GridCostModel::isDoorway(map, tile.x, tile.y)
                                ? doorwayClearance
                                : wallClearance;

    // Sample position in tile units
    const float sx = sample.getX() / tileSize;
    const float sy = sample.getY() / tileSize;

    for (int dy = -1; dy <= 1; ++dy) {
        for (int dx = -1; dx <= 1; ++dx) {
            if (dx == 0 && dy == 0) continue;
            int nx = tile.x + dx;
            int ny = tile.y + dy;
            if (map.isWalkable(nx, ny)) continue;

            float cx = static_cast<float>(nx) + 0.5f - sx;
            float cy = static_cast<float>(ny) + 0.5f - sy;
            if (std::sqrt(cx * cx + cy * cy) < clearance) return false;
        }
    }
    return true;
}

} // namespace

bool PathSmoother::isSegmentClear(const WalkabilityMap& map, const Vector2D& from,
                                  const Vector2D& to, float wallClearance,
                                  float doorwayClearance) {
    const float tileSize = map.getTileSize();
    const float step = tileSize * 0.5f;
    const float length = Vector2D::distance(from, to);
    const int samples = std::max(1, static_cast<int>(std::ceil(length / step)));

    for (int i = 0; i <= samples; ++i) {
        float t = static_cast<float>(i) / static_cast<float>(samples);
        Vector2D sample = from + (to - from) * t;
        if (!isSampleClear(map, sample, tileSize, wallClearance, doorwayClearance)) {
            return false;
        }
    }
    return true;
}

std::vector<Vector2D> PathSmoother::optimizePath(const WalkabilityMap& map,
                                                 const std::vector<Vector2D>& path,
                                                 float wallClearance,
                                                 float doorwayClearance) {
    if (path.size() <= 2) return path;

    std::vector<Vector2D> out;
    out.reserve(path.size());
    out.push_back(path.front());

    size_t anchor = 0;
    const size_t last = path.size() - 1;
    while (anchor < last) {
        // Scan from the far end so a clear shortcut survives a second pass
        size_t next = anchor + 1;
        for (size_t j = last; j >= anchor + 2; --j) {
            if (isSegmentClear(map, path[anchor], path[j], wallClearance, doorwayClearance)) {
                next = j;
                break;
            }
        }
        out.push_back(path[next]);
        anchor = next;
    }
    return out;
}

std::vector<Vector2D> PathSmoother::simplifyPath(const std::vector<Vector2D>& path,
                                                 float tolerance) {
    if (path.size() <= 2) return path;

    std::vector<Vector2D> out;
    out.reserve(path.size());
    out.push_back(path.front());

    size_t anchor = 0;
    const size_t last = path.size() - 1;
    while (anchor < last) {
        size_t candidate = anchor + 1;
        float candidateDist = Vector2D::distance(path[anchor], path[candidate]);
        for (size_t j = candidate + 1; j <= last; ++j) {
            float d = Vector2D::distance(path[anchor], path[j]);
            if (d > candidateDist + tolerance) {
                candidate = j;
                candidateDist = d;
            }
        }
        out.push_back(path[candidate]);
        anchor = candidate;
    }
    return out;
}

} // namespace TileNav
