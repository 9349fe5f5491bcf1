/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/TileMap.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace TileNav {

TileMap::TileMap(int width, int height, float tileSize)
    : m_w(width), m_h(height), m_tileSize(tileSize) {

    if (m_w <= 0 || m_h <= 0) {
        throw std::invalid_argument(std::format("TileMap dimensions must be positive: {}x{}",
                                    width, height));
    }

    if (!(tileSize > 0.0f)) {
        throw std::invalid_argument(std::format("TileMap tile size must be positive: {}",
                                    tileSize));
    }

    m_blocked.assign(static_cast<size_t>(m_w) * static_cast<size_t>(m_h), 0);
}

TileMap TileMap::fromAscii(const std::vector<std::string>& rows, float tileSize) {
    size_t width = 0;
    for (const auto& row : rows) {
        width = std::max(width, row.size());
    }

    TileMap map(static_cast<int>(width), static_cast<int>(rows.size()), tileSize);
    for (int y = 0; y < map.m_h; ++y) {
        const std::string& row = rows[static_cast<size_t>(y)];
        for (int x = 0; x < map.m_w; ++x) {
            bool walkable = static_cast<size_t>(x) < row.size() && row[static_cast<size_t>(x)] != '#';
            map.setWalkable(x, y, walkable);
        }
    }

    TILEMAP_DEBUG(std::format("Loaded {}x{} map, {} walkable tiles",
                  map.m_w, map.m_h, map.countWalkable()));
    return map;
}

bool TileMap::inBounds(int tileX, int tileY) const {
    return tileX >= 0 && tileY >= 0 && tileX < m_w && tileY < m_h;
}

bool TileMap::isWalkable(int tileX, int tileY) const {
    if (!inBounds(tileX, tileY)) return false;
    return m_blocked[static_cast<size_t>(tileY) * static_cast<size_t>(m_w) + static_cast<size_t>(tileX)] == 0;
}

void TileMap::setWalkable(int tileX, int tileY, bool walkable) {
    if (!inBounds(tileX, tileY)) {
        TILEMAP_WARN(std::format("setWalkable ignored for out-of-bounds tile ({},{})", tileX, tileY));
        return;
    }
    m_blocked[static_cast<size_t>(tileY) * static_cast<size_t>(m_w) + static_cast<size_t>(tileX)] =
        walkable ? 0 : 1;
}

void TileMap::fill(bool walkable) {
    std::fill(m_blocked.begin(), m_blocked.end(), walkable ? 0 : 1);
}

void TileMap::addBorderWalls() {
    for (int x = 0; x < m_w; ++x) {
        setBlocked(x, 0);
        setBlocked(x, m_h - 1);
    }
    for (int y = 0; y < m_h; ++y) {
        setBlocked(0, y);
        setBlocked(m_w - 1, y);
    }
}

int TileMap::countWalkable() const {
    return static_cast<int>(std::count(m_blocked.begin(), m_blocked.end(), 0));
}

std::string TileMap::toAscii() const {
    std::string out;
    out.reserve(static_cast<size_t>(m_w + 1) * static_cast<size_t>(m_h));
    for (int y = 0; y < m_h; ++y) {
        for (int x = 0; x < m_w; ++x) {
            out += isWalkable(x, y) ? '.' : '#';
        }
        out += '\n';
    }
    return out;
}

} // namespace TileNav
