/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/Pathfinder.hpp"
#include "ai/pathfinding/GridCostModel.hpp"
#include "ai/pathfinding/PathSmoother.hpp"
#include "ai/pathfinding/StuckDetector.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <queue>
#include <unordered_map>

namespace TileNav {

namespace {

constexpr int DIR_X[8] = {1, -1, 0, 0, 1, 1, -1, -1};
constexpr int DIR_Y[8] = {0, 0, 1, -1, 1, -1, 1, -1};
constexpr float DIAGONAL_COST = 1.41421356f;
constexpr size_t MAX_ARENA_RESERVE = 4096;

struct OpenEntry {
    float f;
    float g;
    size_t index;
};

// Min-heap on f; deeper node first on ties
struct OpenEntryCompare {
    bool operator()(const OpenEntry& a, const OpenEntry& b) const {
        if (a.f != b.f) return a.f > b.f;
        return a.g < b.g;
    }
};

float tileDistance(int ax, int ay, int bx, int by) {
    float dx = static_cast<float>(ax - bx);
    float dy = static_cast<float>(ay - by);
    return std::sqrt(dx * dx + dy * dy);
}

} // namespace

Pathfinder::Pathfinder(const PathfindingConfig& config) : m_config(clampConfig(config)) {}

void Pathfinder::setConfig(const PathfindingConfig& config) {
    m_config = clampConfig(config);
}

PathfindingConfig Pathfinder::clampConfig(const PathfindingConfig& config) {
    if (config.isValid()) return config;

    PATHFIND_WARN("Pathfinder given out-of-range config values, clamping");
    PathfindingConfig clamped = config;
    clamped.maxExpansions = std::max(clamped.maxExpansions, 1);
    clamped.wallPenaltyRadius = std::clamp(clamped.wallPenaltyRadius, 0,
                                           GridCostModel::MAX_PENALTY_RADIUS);
    clamped.stuckThreshold = std::clamp(clamped.stuckThreshold, 1, 8);
    clamped.escapeMaxDistance = std::clamp(clamped.escapeMaxDistance, 1,
                                           StuckDetector::MAX_ESCAPE_DISTANCE);
    clamped.wallClearance = std::max(clamped.wallClearance, 0.0f);
    clamped.doorwayClearance = std::max(clamped.doorwayClearance, 0.0f);
    return clamped;
}

PathfindingResult Pathfinder::findPath(const WalkabilityMap& map,
                                       const Vector2D& startPx,
                                       const Vector2D& targetPx,
                                       std::vector<Vector2D>& outPath,
                                       int maxDistance,
                                       float wallClearance) {
    outPath.clear();
    ++m_stats.totalRequests;

    const float tileSize = map.getTileSize();
    const TileCoord start = TileCoord::fromPixel(startPx, tileSize);
    TileCoord goal = TileCoord::fromPixel(targetPx, tileSize);

    if (StuckDetector::isStuck(map, start.x, start.y, m_config.stuckThreshold)) {
        if (StuckDetector::findEscapePath(map, start.x, start.y, outPath,
                                          m_config.escapeMaxDistance, m_config.stuckThreshold)) {
            ++m_stats.escapePaths;
            PATHFIND_DEBUG(std::format("Start ({},{}) is stuck, returning escape path",
                           start.x, start.y));
            return PathfindingResult::ESCAPE_PATH;
        }
        PATHFIND_DEBUG(std::format("Start ({},{}) is stuck and has no escape, searching anyway",
                       start.x, start.y));
    }

    if (!resolveGoal(map, goal)) {
        ++m_stats.invalidGoals;
        PATHFIND_DEBUG(std::format("Goal ({},{}) and all its neighbours are blocked",
                       goal.x, goal.y));
        return PathfindingResult::INVALID_GOAL;
    }

    if (start == goal) {
        outPath.push_back(startPx);
        recordSuccess(outPath.size());
        return PathfindingResult::SUCCESS;
    }

    std::vector<Vector2D> rawPath;
    PathfindingResult result = runSearch(map, start, goal, rawPath, wallClearance);
    if (result != PathfindingResult::SUCCESS) {
        if (result == PathfindingResult::TIMEOUT) {
            ++m_stats.timeouts;
        } else {
            ++m_stats.noPathFound;
        }
        return result;
    }

    outPath = PathSmoother::optimizePath(map, rawPath, wallClearance, m_config.doorwayClearance);
    if (maxDistance > 0 && outPath.size() > static_cast<size_t>(maxDistance)) {
        outPath.resize(static_cast<size_t>(maxDistance));
    }

    recordSuccess(outPath.size());
    return PathfindingResult::SUCCESS;
}

bool Pathfinder::resolveGoal(const WalkabilityMap& map, TileCoord& goal) {
    if (map.isWalkable(goal)) return true;

    for (int dx = -1; dx <= 1; ++dx) {
        for (int dy = -1; dy <= 1; ++dy) {
            if (dx == 0 && dy == 0) continue;
            if (map.isWalkable(goal.x + dx, goal.y + dy)) {
                PATHFIND_DEBUG(std::format("Goal ({},{}) blocked, retargeting to ({},{})",
                               goal.x, goal.y, goal.x + dx, goal.y + dy));
                goal = TileCoord{goal.x + dx, goal.y + dy};
                ++m_stats.retargetedGoals;
                return true;
            }
        }
    }
    return false;
}

PathfindingResult Pathfinder::runSearch(const WalkabilityMap& map, const TileCoord& start,
                                        const TileCoord& goal, std::vector<Vector2D>& outPath,
                                        float wallClearance) {
    std::vector<SearchNode> nodes;
    nodes.reserve(std::min(static_cast<size_t>(m_config.maxExpansions) * 2, MAX_ARENA_RESERVE));
    std::unordered_map<TileCoord, size_t, TileCoordHash> index;
    std::priority_queue<OpenEntry, std::vector<OpenEntry>, OpenEntryCompare> open;

    auto makeNode = [&](int x, int y) {
        SearchNode node{};
        node.x = x;
        node.y = y;
        node.parent = -1;
        node.h = tileDistance(x, y, goal.x, goal.y);
        node.wallPenalty = GridCostModel::wallPenalty(map, x, y, m_config.wallPenaltyRadius);
        node.isDoorway = GridCostModel::isDoorway(map, x, y);
        node.closed = false;
        return node;
    };

    SearchNode startNode = makeNode(start.x, start.y);
    startNode.g = 0.0f;
    startNode.f = startNode.h;
    nodes.push_back(startNode);
    index.emplace(start, 0);
    open.push(OpenEntry{startNode.f, 0.0f, 0});

    int expansions = 0;
    while (!open.empty()) {
        OpenEntry entry = open.top();
        open.pop();

        // Lazy deletion: drop entries superseded by a cheaper re-insertion
        if (nodes[entry.index].closed || entry.g > nodes[entry.index].g) continue;

        // The goal pop counts against the cap like any other
        if (expansions >= m_config.maxExpansions) {
            m_stats.totalExpansions += static_cast<uint64_t>(expansions);
            PATHFIND_DEBUG(std::format("Search ({},{}) -> ({},{}) hit the {} expansion cap",
                           start.x, start.y, goal.x, goal.y, m_config.maxExpansions));
            return PathfindingResult::TIMEOUT;
        }
        ++expansions;

        if (nodes[entry.index].x == goal.x && nodes[entry.index].y == goal.y) {
            for (int i = static_cast<int>(entry.index); i >= 0; i = nodes[static_cast<size_t>(i)].parent) {
                const SearchNode& n = nodes[static_cast<size_t>(i)];
                outPath.push_back(TileCoord{n.x, n.y}.toPixelCenter(map.getTileSize()));
            }
            std::reverse(outPath.begin(), outPath.end());
            m_stats.totalExpansions += static_cast<uint64_t>(expansions);
            PATHFIND_DEBUG(std::format("Path ({},{}) -> ({},{}) found: {} waypoints, {} expansions",
                           start.x, start.y, goal.x, goal.y, outPath.size(), expansions));
            return PathfindingResult::SUCCESS;
        }

        nodes[entry.index].closed = true;
        const int cx = nodes[entry.index].x;
        const int cy = nodes[entry.index].y;
        const float cg = nodes[entry.index].g;
        const bool currentDoorway = nodes[entry.index].isDoorway;

        for (int dir = 0; dir < 8; ++dir) {
            const int nx = cx + DIR_X[dir];
            const int ny = cy + DIR_Y[dir];
            if (!map.isWalkable(nx, ny)) continue;

            const bool diagonal = DIR_X[dir] != 0 && DIR_Y[dir] != 0;
            if (diagonal && (!map.isWalkable(cx + DIR_X[dir], cy) || !map.isWalkable(cx, cy + DIR_Y[dir]))) {
                continue;  // no corner cutting
            }

            const TileCoord coord{nx, ny};
            auto it = index.find(coord);
            const bool fresh = (it == index.end());
            size_t ni;
            if (fresh) {
                ni = nodes.size();
                nodes.push_back(makeNode(nx, ny));
                index.emplace(coord, ni);
            } else {
                ni = it->second;
                if (nodes[ni].closed) continue;
            }

            const float clearance = (currentDoorway || nodes[ni].isDoorway)
                                        ? m_config.doorwayClearance
                                        : wallClearance;
            const float step = diagonal ? DIAGONAL_COST : 1.0f;
            const float tentativeG = cg + step + nodes[ni].wallPenalty * clearance;

            if (fresh || tentativeG < nodes[ni].g) {
                nodes[ni].g = tentativeG;
                nodes[ni].f = tentativeG + nodes[ni].h;
                nodes[ni].parent = static_cast<int>(entry.index);
                open.push(OpenEntry{nodes[ni].f, tentativeG, ni});
            }
        }
    }

    m_stats.totalExpansions += static_cast<uint64_t>(expansions);
    PATHFIND_DEBUG(std::format("No path ({},{}) -> ({},{}) after {} expansions",
                   start.x, start.y, goal.x, goal.y, expansions));
    return PathfindingResult::NO_PATH_FOUND;
}

void Pathfinder::recordSuccess(size_t pathLength) {
    ++m_stats.successfulPaths;
    const double n = static_cast<double>(m_stats.successfulPaths);
    m_stats.avgPathLength += (static_cast<double>(pathLength) - m_stats.avgPathLength) / n;
}

} // namespace TileNav
