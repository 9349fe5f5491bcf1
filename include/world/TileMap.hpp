/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TILE_MAP_HPP
#define TILE_MAP_HPP

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <ostream>
#include <string>
#include <vector>
#include "utils/Vector2D.hpp"

namespace TileNav {

// Tile edge length in pixels shared by maps that don't specify their own
constexpr float TILE_SIZE = 32.0f;

/**
 * @brief Integer grid-cell address
 */
struct TileCoord {
    int x{0};
    int y{0};

    bool operator==(const TileCoord& other) const { return x == other.x && y == other.y; }
    bool operator!=(const TileCoord& other) const { return !(*this == other); }

    // Floor division, so negative pixel positions land on negative tiles
    static TileCoord fromPixel(const Vector2D& px, float tileSize) {
        return TileCoord{static_cast<int>(std::floor(px.getX() / tileSize)),
                         static_cast<int>(std::floor(px.getY() / tileSize))};
    }

    Vector2D toPixelCenter(float tileSize) const {
        return Vector2D(x * tileSize + tileSize * 0.5f, y * tileSize + tileSize * 0.5f);
    }

    int manhattanTo(const TileCoord& other) const {
        return std::abs(x - other.x) + std::abs(y - other.y);
    }
};

inline std::ostream& operator<<(std::ostream& os, const TileCoord& t) {
    return os << "(" << t.x << ", " << t.y << ")";
}

struct TileCoordHash {
    size_t operator()(const TileCoord& t) const {
        // Pack both halves into one 64-bit key
        uint64_t key = (static_cast<uint64_t>(static_cast<uint32_t>(t.x)) << 32) |
                       static_cast<uint32_t>(t.y);
        return std::hash<uint64_t>{}(key);
    }
};

/**
 * @brief Read-only walkability view consumed by the pathfinding code
 *
 * isWalkable() must be defined for every integer coordinate and answer
 * false outside the map.
 */
class WalkabilityMap {
public:
    virtual ~WalkabilityMap() = default;

    virtual bool isWalkable(int tileX, int tileY) const = 0;
    virtual float getTileSize() const { return TILE_SIZE; }

    bool isWalkable(const TileCoord& t) const { return isWalkable(t.x, t.y); }
};

/**
 * @brief Dense row-major tile grid (0 = floor, 1 = wall)
 */
class TileMap : public WalkabilityMap {
public:
    TileMap(int width, int height, float tileSize = TILE_SIZE);

    // '#' marks a wall, any other character is floor. Rows may differ in
    // length; missing cells are walls.
    static TileMap fromAscii(const std::vector<std::string>& rows, float tileSize = TILE_SIZE);

    bool isWalkable(int tileX, int tileY) const override;
    float getTileSize() const override { return m_tileSize; }
    using WalkabilityMap::isWalkable;

    void setWalkable(int tileX, int tileY, bool walkable);
    void setBlocked(int tileX, int tileY) { setWalkable(tileX, tileY, false); }
    void fill(bool walkable);
    void addBorderWalls();

    bool inBounds(int tileX, int tileY) const;
    int getWidth() const { return m_w; }
    int getHeight() const { return m_h; }
    int countWalkable() const;

    Vector2D tileCenter(int tileX, int tileY) const {
        return TileCoord{tileX, tileY}.toPixelCenter(m_tileSize);
    }

    std::string toAscii() const;

private:
    int m_w;
    int m_h;
    float m_tileSize;
    std::vector<uint8_t> m_blocked;
};

} // namespace TileNav

#endif // TILE_MAP_HPP
