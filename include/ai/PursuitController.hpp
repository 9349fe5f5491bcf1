/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PURSUIT_CONTROLLER_HPP
#define PURSUIT_CONTROLLER_HPP

#include <SDL3/SDL.h>
#include <cstddef>
#include <ostream>
#include <vector>
#include "ai/pathfinding/Pathfinder.hpp"
#include "ai/pathfinding/PathfindingConfig.hpp"
#include "utils/Vector2D.hpp"
#include "world/TileMap.hpp"

namespace TileNav {

enum class PursuitState { IDLE, FOLLOWING_PATH, DIRECT };

inline std::ostream& operator<<(std::ostream& os, const PursuitState& state) {
    switch (state) {
        case PursuitState::IDLE: return os << "IDLE";
        case PursuitState::FOLLOWING_PATH: return os << "FOLLOWING_PATH";
        case PursuitState::DIRECT: return os << "DIRECT";
        default: return os << "UNKNOWN";
    }
}

/**
 * @brief Per-agent chase steering on top of a shared Pathfinder
 *
 * Call update() once per tick with the agent and target positions; it
 * returns the velocity (pixels per second) the agent should move at.
 * Re-planning happens at most once per repathIntervalMs. When planning
 * fails the agent heads straight for the target until the next re-plan.
 */
class PursuitController {
public:
    PursuitController(Pathfinder& pathfinder, const PathfindingConfig& config = PathfindingConfig{});

    Vector2D update(const WalkabilityMap& map, const Vector2D& position,
                    const Vector2D& targetPosition, Uint64 nowMs);

    PursuitState getState() const { return m_state; }
    const std::vector<Vector2D>& getPath() const { return m_path; }
    size_t getWaypointIndex() const { return m_waypointIndex; }
    int getRepathCount() const { return m_repathCount; }
    PathfindingResult getLastResult() const { return m_lastResult; }

    // Drops the path and the repath cooldown
    void reset();

private:
    struct RepathCooldown {
        Uint64 nextRepath{0};
        bool primed{false};

        bool canRepath(Uint64 now) const { return !primed || now >= nextRepath; }
        void apply(Uint64 now, Uint64 intervalMs) {
            nextRepath = now + intervalMs;
            primed = true;
        }
    };

    void repath(const WalkabilityMap& map, const Vector2D& position,
                const Vector2D& targetPosition, Uint64 nowMs);
    bool advanceWaypoints(const Vector2D& position, float reachRadius);

    Pathfinder& m_pathfinder;
    PathfindingConfig m_config;

    std::vector<Vector2D> m_path;
    size_t m_waypointIndex{0};
    RepathCooldown m_cooldown{};
    PursuitState m_state{PursuitState::IDLE};
    PathfindingResult m_lastResult{PathfindingResult::NO_PATH_FOUND};
    int m_repathCount{0};
};

} // namespace TileNav

#endif // PURSUIT_CONTROLLER_HPP
