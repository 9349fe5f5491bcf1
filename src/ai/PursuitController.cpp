/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/PursuitController.hpp"
#include "core/Logger.hpp"
#include <format>
#include <sstream>

namespace TileNav {

PursuitController::PursuitController(Pathfinder& pathfinder, const PathfindingConfig& config)
    : m_pathfinder(pathfinder), m_config(config) {}

void PursuitController::reset() {
    m_path.clear();
    m_waypointIndex = 0;
    m_cooldown = RepathCooldown{};
    m_state = PursuitState::IDLE;
    m_lastResult = PathfindingResult::NO_PATH_FOUND;
}

Vector2D PursuitController::update(const WalkabilityMap& map, const Vector2D& position,
                                   const Vector2D& targetPosition, Uint64 nowMs) {
    const float tileSize = map.getTileSize();
    const float chaseRange = static_cast<float>(m_config.chaseRangeTiles) * tileSize;

    if (Vector2D::distance(position, targetPosition) >= chaseRange) {
        if (m_state != PursuitState::IDLE) {
            PURSUIT_DEBUG("Target out of range, going idle");
        }
        m_path.clear();
        m_waypointIndex = 0;
        m_state = PursuitState::IDLE;
        return Vector2D(0.0f, 0.0f);
    }

    if (m_cooldown.canRepath(nowMs)) {
        repath(map, position, targetPosition, nowMs);
    }

    if (advanceWaypoints(position, m_config.waypointRadius * tileSize)) {
        m_state = PursuitState::FOLLOWING_PATH;
        return (m_path[m_waypointIndex] - position).normalized() * m_config.chaseSpeed;
    }

    // No usable path: head straight for the target
    m_state = PursuitState::DIRECT;
    return (targetPosition - position).normalized() * m_config.chaseSpeed;
}

void PursuitController::repath(const WalkabilityMap& map, const Vector2D& position,
                               const Vector2D& targetPosition, Uint64 nowMs) {
    m_lastResult = m_pathfinder.findPath(map, position, targetPosition, m_path,
                                         m_config.maxPathLength, m_config.wallClearance);
    m_waypointIndex = 0;
    ++m_repathCount;
    m_cooldown.apply(nowMs, m_config.repathIntervalMs);

    if (m_lastResult != PathfindingResult::SUCCESS &&
        m_lastResult != PathfindingResult::ESCAPE_PATH) {
        std::stringstream ss;
        ss << m_lastResult;
        PURSUIT_DEBUG(std::format("Repath failed ({}), falling back to direct movement", ss.str()));
        m_path.clear();
    }
}

bool PursuitController::advanceWaypoints(const Vector2D& position, float reachRadius) {
    const float reachSq = reachRadius * reachRadius;
    while (m_waypointIndex < m_path.size() &&
           Vector2D::distanceSquared(position, m_path[m_waypointIndex]) <= reachSq) {
        ++m_waypointIndex;
    }

    if (m_waypointIndex >= m_path.size()) {
        m_path.clear();
        m_waypointIndex = 0;
        return false;
    }
    return true;
}

} // namespace TileNav
