/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE PathfindingConfigTests
#include <boost/test/unit_test.hpp>

#include "ai/pathfinding/GridCostModel.hpp"
#include "ai/pathfinding/PathSmoother.hpp"
#include "ai/pathfinding/Pathfinder.hpp"
#include "ai/pathfinding/PathfindingConfig.hpp"
#include "ai/pathfinding/StuckDetector.hpp"
#include "world/TileMap.hpp"
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

using namespace TileNav;

struct ConfigFileFixture {
    ConfigFileFixture()
        : path((std::filesystem::temp_directory_path() / "tilenav_config_test.json").string()) {}

    ~ConfigFileFixture() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    void write(const std::string& contents) {
        std::ofstream file(path, std::ios::trunc);
        file << contents;
    }

    std::string path;
    PathfindingConfig config;
};

BOOST_AUTO_TEST_SUITE(PathfindingConfigDefaultsTests)

BOOST_AUTO_TEST_CASE(TestDefaults)
{
    PathfindingConfig config;
    BOOST_CHECK_EQUAL(config.maxPathLength, 20);
    BOOST_CHECK_CLOSE(config.wallClearance, 1.5f, 0.001f);
    BOOST_CHECK_CLOSE(config.doorwayClearance, 0.5f, 0.001f);
    BOOST_CHECK_EQUAL(config.maxExpansions, 500);
    BOOST_CHECK_EQUAL(config.wallPenaltyRadius, 2);
    BOOST_CHECK_EQUAL(config.stuckThreshold, 3);
    BOOST_CHECK_EQUAL(config.escapeMaxDistance, 8);
    BOOST_CHECK_CLOSE(config.simplifyTolerance, 1.0f, 0.001f);
    BOOST_CHECK_EQUAL(config.chaseRangeTiles, 5);
    BOOST_CHECK_CLOSE(config.chaseSpeed, 120.0f, 0.001f);
    BOOST_CHECK_EQUAL(config.repathIntervalMs, 1000u);
    BOOST_CHECK_CLOSE(config.waypointRadius, 0.25f, 0.001f);
    BOOST_CHECK(config.isValid());
}

BOOST_AUTO_TEST_CASE(TestInvalidValuesDetected)
{
    PathfindingConfig config;
    config.maxExpansions = 0;
    BOOST_CHECK(!config.isValid());

    config = PathfindingConfig{};
    config.wallClearance = -1.0f;
    BOOST_CHECK(!config.isValid());

    config = PathfindingConfig{};
    config.wallPenaltyRadius = GridCostModel::MAX_PENALTY_RADIUS + 1;
    BOOST_CHECK(!config.isValid());

    config = PathfindingConfig{};
    config.escapeMaxDistance = StuckDetector::MAX_ESCAPE_DISTANCE + 1;
    BOOST_CHECK(!config.isValid());

    config = PathfindingConfig{};
    config.wallPenaltyRadius = GridCostModel::MAX_PENALTY_RADIUS;
    config.escapeMaxDistance = StuckDetector::MAX_ESCAPE_DISTANCE;
    BOOST_CHECK(config.isValid());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(PathfindingConfigLoadTests)

BOOST_FIXTURE_TEST_CASE(TestLoadFullFile, ConfigFileFixture)
{
    write(R"({
        "pathfinding": {
            "maxPathLength": 12,
            "wallClearance": 1.0,
            "doorwayClearance": 0.25,
            "maxExpansions": 800,
            "wallPenaltyRadius": 3,
            "stuckThreshold": 4,
            "escapeMaxDistance": 6,
            "simplifyTolerance": 2.5
        },
        "pursuit": {
            "chaseRangeTiles": 8,
            "chaseSpeed": 90.5,
            "repathIntervalMs": 250,
            "waypointRadius": 0.4
        }
    })");

    BOOST_REQUIRE(config.loadFromFile(path));
    BOOST_CHECK_EQUAL(config.maxPathLength, 12);
    BOOST_CHECK_CLOSE(config.wallClearance, 1.0f, 0.001f);
    BOOST_CHECK_CLOSE(config.doorwayClearance, 0.25f, 0.001f);
    BOOST_CHECK_EQUAL(config.maxExpansions, 800);
    BOOST_CHECK_EQUAL(config.wallPenaltyRadius, 3);
    BOOST_CHECK_EQUAL(config.stuckThreshold, 4);
    BOOST_CHECK_EQUAL(config.escapeMaxDistance, 6);
    BOOST_CHECK_CLOSE(config.simplifyTolerance, 2.5f, 0.001f);
    BOOST_CHECK_EQUAL(config.chaseRangeTiles, 8);
    BOOST_CHECK_CLOSE(config.chaseSpeed, 90.5f, 0.001f);
    BOOST_CHECK_EQUAL(config.repathIntervalMs, 250u);
    BOOST_CHECK_CLOSE(config.waypointRadius, 0.4f, 0.001f);
    BOOST_CHECK(config.isValid());
}

BOOST_FIXTURE_TEST_CASE(TestPartialFileKeepsDefaults, ConfigFileFixture)
{
    write(R"({ "pathfinding": { "maxExpansions": 250 } })");

    BOOST_REQUIRE(config.loadFromFile(path));
    BOOST_CHECK_EQUAL(config.maxExpansions, 250);
    BOOST_CHECK_EQUAL(config.maxPathLength, 20);
    BOOST_CHECK_CLOSE(config.chaseSpeed, 120.0f, 0.001f);
}

BOOST_FIXTURE_TEST_CASE(TestMissingFileFails, ConfigFileFixture)
{
    BOOST_CHECK(!config.loadFromFile(path + ".missing"));
    BOOST_CHECK_EQUAL(config.maxExpansions, 500);
}

BOOST_FIXTURE_TEST_CASE(TestMalformedJsonFails, ConfigFileFixture)
{
    write(R"({ "pathfinding": { "maxExpansions": 250, } )");
    BOOST_CHECK(!config.loadFromFile(path));
    BOOST_CHECK_EQUAL(config.maxExpansions, 500);
}

BOOST_FIXTURE_TEST_CASE(TestNonObjectRootFails, ConfigFileFixture)
{
    write("[1, 2, 3]");
    BOOST_CHECK(!config.loadFromFile(path));
}

BOOST_FIXTURE_TEST_CASE(TestWrongTypesKeepDefaults, ConfigFileFixture)
{
    write(R"({
        "pathfinding": { "maxExpansions": "lots", "wallClearance": true, "stuckThreshold": 2.5 },
        "pursuit": { "chaseSpeed": null, "chaseRangeTiles": 7 }
    })");

    BOOST_REQUIRE(config.loadFromFile(path));
    BOOST_CHECK_EQUAL(config.maxExpansions, 500);
    BOOST_CHECK_CLOSE(config.wallClearance, 1.5f, 0.001f);
    BOOST_CHECK_EQUAL(config.stuckThreshold, 3);
    BOOST_CHECK_CLOSE(config.chaseSpeed, 120.0f, 0.001f);
    BOOST_CHECK_EQUAL(config.chaseRangeTiles, 7);
}

BOOST_FIXTURE_TEST_CASE(TestOutOfRangeValuesRejected, ConfigFileFixture)
{
    write(R"({
        "pathfinding": { "maxExpansions": 0, "wallClearance": -0.5, "stuckThreshold": 9,
                         "maxPathLength": -1 },
        "pursuit": { "chaseSpeed": 0, "repathIntervalMs": -10, "waypointRadius": 0.0 }
    })");

    BOOST_REQUIRE(config.loadFromFile(path));
    BOOST_CHECK_EQUAL(config.maxExpansions, 500);
    BOOST_CHECK_CLOSE(config.wallClearance, 1.5f, 0.001f);
    BOOST_CHECK_EQUAL(config.stuckThreshold, 3);
    BOOST_CHECK_CLOSE(config.chaseSpeed, 120.0f, 0.001f);
    BOOST_CHECK_EQUAL(config.repathIntervalMs, 1000u);
    BOOST_CHECK_CLOSE(config.waypointRadius, 0.25f, 0.001f);

    // Non-positive path length is meaningful: no truncation
    BOOST_CHECK_EQUAL(config.maxPathLength, -1);
}

BOOST_FIXTURE_TEST_CASE(TestHugeRadiiRejected, ConfigFileFixture)
{
    write(R"({
        "pathfinding": { "wallPenaltyRadius": 2147483647, "escapeMaxDistance": 2147483647 }
    })");

    BOOST_REQUIRE(config.loadFromFile(path));
    BOOST_CHECK_EQUAL(config.wallPenaltyRadius, 2);
    BOOST_CHECK_EQUAL(config.escapeMaxDistance, 8);
    BOOST_CHECK(config.isValid());
}

BOOST_FIXTURE_TEST_CASE(TestLargestExpansionCapStillSearches, ConfigFileFixture)
{
    write(R"({ "pathfinding": { "maxExpansions": 2147483647 } })");
    BOOST_REQUIRE(config.loadFromFile(path));
    BOOST_REQUIRE_EQUAL(config.maxExpansions, std::numeric_limits<int>::max());
    BOOST_REQUIRE(config.isValid());

    TileMap map(10, 10);
    Pathfinder pathfinder(config);
    std::vector<Vector2D> path;
    PathfindingResult result = PathfindingResult::NO_PATH_FOUND;
    BOOST_CHECK_NO_THROW(result = pathfinder.findPath(map, map.tileCenter(1, 1),
                                                      map.tileCenter(8, 8), path));
    BOOST_CHECK_EQUAL(result, PathfindingResult::SUCCESS);
    BOOST_CHECK(!path.empty());
}

BOOST_FIXTURE_TEST_CASE(TestLoadedToleranceDrivesSimplify, ConfigFileFixture)
{
    const std::vector<Vector2D> tight{Vector2D(0.0f, 0.0f), Vector2D(1.0f, 0.0f),
                                      Vector2D(2.0f, 0.0f), Vector2D(3.0f, 0.0f)};
    BOOST_CHECK_EQUAL(PathSmoother::simplifyPath(tight, config.simplifyTolerance).size(), 2u);

    write(R"({ "pathfinding": { "simplifyTolerance": 10.0 } })");
    BOOST_REQUIRE(config.loadFromFile(path));
    BOOST_CHECK(PathSmoother::simplifyPath(tight, config.simplifyTolerance) == tight);
}

BOOST_FIXTURE_TEST_CASE(TestUnknownKeysIgnored, ConfigFileFixture)
{
    write(R"({
        "pathfinding": { "heuristic": "manhattan", "maxExpansions": 42 },
        "rendering": { "vsync": true },
        "pursuit": 5
    })");

    BOOST_REQUIRE(config.loadFromFile(path));
    BOOST_CHECK_EQUAL(config.maxExpansions, 42);
    BOOST_CHECK_EQUAL(config.chaseRangeTiles, 5);
}

BOOST_FIXTURE_TEST_CASE(TestLoadedConfigDrivesSearch, ConfigFileFixture)
{
    write(R"({ "pathfinding": { "maxExpansions": 3 } })");
    BOOST_REQUIRE(config.loadFromFile(path));

    TileMap map(20, 20);
    Pathfinder pathfinder(config);
    std::vector<Vector2D> path;
    PathfindingResult result = pathfinder.findPath(map, map.tileCenter(2, 2),
                                                   map.tileCenter(17, 17), path);
    BOOST_CHECK_EQUAL(result, PathfindingResult::TIMEOUT);
}

BOOST_AUTO_TEST_SUITE_END()
