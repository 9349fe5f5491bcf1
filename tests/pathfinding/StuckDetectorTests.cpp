/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE StuckDetectorTests
#include <boost/test/unit_test.hpp>

#include "ai/pathfinding/PathSmoother.hpp"
#include "ai/pathfinding/StuckDetector.hpp"
#include "world/TileMap.hpp"
#include <limits>
#include <vector>

using namespace TileNav;

// Dead-end alcove hanging off the bottom of a room
struct DeadEndFixture {
    DeadEndFixture()
        : map(TileMap::fromAscii({
              "#########",
              "#.......#",
              "#.......#",
              "#.......#",
              "####.####",
              "####.####",
              "#########",
          })) {}

    TileMap map;
    std::vector<Vector2D> path;
};

BOOST_AUTO_TEST_SUITE(IsStuckTests)

BOOST_AUTO_TEST_CASE(TestOpenTileNotStuck)
{
    TileMap map(5, 5);
    BOOST_CHECK(!StuckDetector::isStuck(map, 2, 2));
}

BOOST_AUTO_TEST_CASE(TestThreeSidedEnclosure)
{
    TileMap map(5, 5);
    map.setBlocked(1, 2);
    map.setBlocked(3, 2);
    map.setBlocked(2, 1);
    BOOST_CHECK(StuckDetector::isStuck(map, 2, 2));
}

BOOST_AUTO_TEST_CASE(TestTwoWallCorner)
{
    TileMap map(5, 5);
    map.setBlocked(3, 2);
    map.setBlocked(2, 3);

    // Only two blocked neighbours, caught by the corner-pocket rule
    BOOST_CHECK(StuckDetector::isStuck(map, 2, 2));
    BOOST_CHECK(StuckDetector::isStuck(map, 2, 2, 8));
}

BOOST_AUTO_TEST_CASE(TestCorridorNotStuck)
{
    TileMap map(5, 5);
    map.setBlocked(1, 2);
    map.setBlocked(3, 2);
    BOOST_CHECK(!StuckDetector::isStuck(map, 2, 2));
}

BOOST_AUTO_TEST_CASE(TestThresholdOnDiagonalWalls)
{
    TileMap map(5, 5);
    map.setBlocked(1, 1);
    map.setBlocked(3, 1);
    map.setBlocked(1, 3);

    BOOST_CHECK(StuckDetector::isStuck(map, 2, 2, 3));
    BOOST_CHECK(!StuckDetector::isStuck(map, 2, 2, 4));
}

BOOST_AUTO_TEST_CASE(TestMapEdgeCountsAsWall)
{
    TileMap map(5, 5);
    BOOST_CHECK(StuckDetector::isStuck(map, 0, 0));
    BOOST_CHECK(StuckDetector::isStuck(map, 2, 0));
    BOOST_CHECK(!StuckDetector::isStuck(map, 1, 1));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(EscapePathTests)

BOOST_FIXTURE_TEST_CASE(TestDeadEndPocketEscapesTowardExit, DeadEndFixture)
{
    BOOST_REQUIRE(StuckDetector::isStuck(map, 4, 5));
    BOOST_REQUIRE(StuckDetector::findEscapePath(map, 4, 5, path));

    BOOST_REQUIRE_EQUAL(path.size(), 2u);
    BOOST_CHECK_EQUAL(path[0], map.tileCenter(4, 5));
    BOOST_CHECK_EQUAL(path[1], map.tileCenter(4, 3));

    // Destination is inside the room, not the stuck corridor tile
    TileCoord dest = TileCoord::fromPixel(path[1], map.getTileSize());
    BOOST_CHECK(map.isWalkable(dest));
    BOOST_CHECK(!StuckDetector::isStuck(map, dest.x, dest.y));
    BOOST_CHECK_LT(path[1].getY(), path[0].getY());
}

BOOST_FIXTURE_TEST_CASE(TestEscapeLimitedByMaxDistance, DeadEndFixture)
{
    // The only tile within one step is the stuck corridor tile
    BOOST_CHECK(!StuckDetector::findEscapePath(map, 4, 5, path, 1));
    BOOST_CHECK(path.empty());

    BOOST_CHECK(StuckDetector::findEscapePath(map, 4, 5, path, 2));
    BOOST_CHECK_EQUAL(path.size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestSealedCellHasNoEscape)
{
    TileMap map = TileMap::fromAscii({
        "###",
        "#.#",
        "###",
    });

    std::vector<Vector2D> path{Vector2D(1.0f, 1.0f)};
    BOOST_CHECK(!StuckDetector::findEscapePath(map, 1, 1, path));
    BOOST_CHECK(path.empty());
}

BOOST_AUTO_TEST_CASE(TestEmergencyHopToDiagonalNeighbour)
{
    TileMap map = TileMap::fromAscii({
        "......",
        "..#...",
        ".#....",
        "..###.",
        "......",
        "......",
    });

    BOOST_REQUIRE(StuckDetector::isStuck(map, 2, 2));
    BOOST_REQUIRE(StuckDetector::isStuck(map, 3, 2));

    // Ring 1 holds only walls and a stuck tile, so the diagonal hop is used
    std::vector<Vector2D> path;
    BOOST_REQUIRE(StuckDetector::findEscapePath(map, 2, 2, path, 1));
    BOOST_REQUIRE_EQUAL(path.size(), 2u);
    BOOST_CHECK_EQUAL(path[1], map.tileCenter(3, 1));
}

BOOST_AUTO_TEST_CASE(TestNearestOpenSpaceWins)
{
    TileMap map(9, 9);
    map.setBlocked(3, 4);
    map.setBlocked(5, 4);
    map.setBlocked(4, 3);

    // (4,5) is open and one step away
    std::vector<Vector2D> path;
    BOOST_REQUIRE(StuckDetector::findEscapePath(map, 4, 4, path));
    BOOST_CHECK_EQUAL(path[1], map.tileCenter(4, 5));
}

BOOST_FIXTURE_TEST_CASE(TestHugeMaxDistanceClamped, DeadEndFixture)
{
    std::vector<Vector2D> clamped;
    BOOST_REQUIRE(StuckDetector::findEscapePath(map, 4, 5, clamped,
                                                StuckDetector::MAX_ESCAPE_DISTANCE));
    BOOST_REQUIRE(StuckDetector::findEscapePath(map, 4, 5, path,
                                                std::numeric_limits<int>::max()));
    BOOST_CHECK(path == clamped);
}

BOOST_AUTO_TEST_CASE(TestHopMayCrossWalls)
{
    // The pocket at (1,1) is sealed; open floor lies behind its east wall
    TileMap map = TileMap::fromAscii({
        "#########",
        "#.#.....#",
        "###.....#",
        "###.....#",
        "###.....#",
        "#########",
    });

    std::vector<Vector2D> path;
    BOOST_REQUIRE(StuckDetector::findEscapePath(map, 1, 1, path));
    BOOST_REQUIRE_EQUAL(path.size(), 2u);
    BOOST_CHECK_EQUAL(path[0], map.tileCenter(1, 1));
    BOOST_CHECK(map.isWalkable(TileCoord::fromPixel(path[1], map.getTileSize())));
    BOOST_CHECK(!PathSmoother::isSegmentClear(map, path[0], path[1], 0.0f, 0.0f));
}

BOOST_AUTO_TEST_SUITE_END()
