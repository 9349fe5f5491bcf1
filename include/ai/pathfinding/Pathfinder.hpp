/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATHFINDER_HPP
#define PATHFINDER_HPP

#include <cstdint>
#include <ostream>
#include <vector>
#include "ai/pathfinding/PathfindingConfig.hpp"
#include "utils/Vector2D.hpp"
#include "world/TileMap.hpp"

namespace TileNav {

enum class PathfindingResult { SUCCESS, ESCAPE_PATH, NO_PATH_FOUND, INVALID_GOAL, TIMEOUT };

// Stream operator for PathfindingResult to support test output
inline std::ostream& operator<<(std::ostream& os, const PathfindingResult& result) {
    switch (result) {
        case PathfindingResult::SUCCESS: return os << "SUCCESS";
        case PathfindingResult::ESCAPE_PATH: return os << "ESCAPE_PATH";
        case PathfindingResult::NO_PATH_FOUND: return os << "NO_PATH_FOUND";
        case PathfindingResult::INVALID_GOAL: return os << "INVALID_GOAL";
        case PathfindingResult::TIMEOUT: return os << "TIMEOUT";
        default: return os << "UNKNOWN";
    }
}

struct PathfindingStats {
    uint64_t totalRequests{0};
    uint64_t successfulPaths{0};
    uint64_t escapePaths{0};
    uint64_t retargetedGoals{0};
    uint64_t invalidGoals{0};
    uint64_t timeouts{0};
    uint64_t noPathFound{0};
    uint64_t totalExpansions{0};
    double avgPathLength{0.0};  // waypoints, over successful searches
};

/**
 * @brief Weighted 8-directional A* over a WalkabilityMap
 *
 * Each findPath() call is self-contained; only the statistics block
 * outlives it. Use one instance per thread.
 */
class Pathfinder {
public:
    explicit Pathfinder(const PathfindingConfig& config = PathfindingConfig{});

    /**
     * @brief Plans a pixel-space route from startPx to targetPx
     *
     * SUCCESS and ESCAPE_PATH fill outPath with tile-center waypoints; every
     * other result leaves it empty. A blocked target is silently moved to its
     * first walkable neighbour. maxDistance caps the waypoint count after
     * smoothing; zero or negative keeps the full path.
     */
    PathfindingResult findPath(const WalkabilityMap& map,
                               const Vector2D& startPx,
                               const Vector2D& targetPx,
                               std::vector<Vector2D>& outPath,
                               int maxDistance = 20,
                               float wallClearance = 1.5f);

    const PathfindingStats& getStats() const { return m_stats; }
    void resetStats() { m_stats = PathfindingStats{}; }

    const PathfindingConfig& getConfig() const { return m_config; }
    // Out-of-range values are clamped into their valid ranges with a warning
    void setConfig(const PathfindingConfig& config);

private:
    struct SearchNode {
        int x;
        int y;
        int parent;  // arena index, -1 for the start node
        float g;
        float h;
        float f;
        float wallPenalty;
        bool isDoorway;
        bool closed;
    };

    PathfindingResult runSearch(const WalkabilityMap& map, const TileCoord& start,
                                const TileCoord& goal, std::vector<Vector2D>& outPath,
                                float wallClearance);

    static PathfindingConfig clampConfig(const PathfindingConfig& config);
    bool resolveGoal(const WalkabilityMap& map, TileCoord& goal);
    void recordSuccess(size_t pathLength);

    PathfindingConfig m_config;
    PathfindingStats m_stats{};
};

} // namespace TileNav

#endif // PATHFINDER_HPP
