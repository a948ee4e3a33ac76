#include <catch2/catch.hpp>

#include "obstacles.hpp"

using namespace lanejump;

TEST_CASE("spawn trial respects the rate", "[obstacles]") {
    std::mt19937 rng(1);
    ObstacleStream s(rng);

    for (int i = 0; i < 200; ++i) CHECK_FALSE(s.spawn(0.0, 15, 40));
    CHECK(s.size() == 0);

    for (int i = 0; i < 200; ++i) CHECK(s.spawn(1.0, 15, 40));
    REQUIRE(s.size() == 200);
    for (const auto& o : s.obstacles()) {
        CHECK(o.col == 38);
        CHECK(o.row >= 1);
        CHECK(o.row <= 13);
    }
}

TEST_CASE("spawn rate is roughly honoured", "[obstacles]") {
    std::mt19937 rng(2024);
    ObstacleStream s(rng);
    int spawned = 0;
    for (int i = 0; i < 10000; ++i) spawned += s.spawn(0.2, 15, 40) ? 1 : 0;
    CHECK(spawned > 1800);
    CHECK(spawned < 2200);
}

TEST_CASE("advance moves by speed and prunes off-screen", "[obstacles]") {
    std::mt19937 rng(1);
    ObstacleStream s(rng);
    s.insert({5, 38});
    s.insert({6, 3});
    s.insert({7, 2});

    s.advance(2);
    REQUIRE(s.size() == 2);
    CHECK(s.obstacles()[0].col == 36);
    CHECK(s.obstacles()[1].col == 1);

    s.advance(1);
    REQUIRE(s.size() == 1);
    CHECK(s.obstacles()[0].row == 5);
    CHECK(s.obstacles()[0].col == 35);
}

TEST_CASE("collision removes exactly the matching obstacles", "[obstacles]") {
    std::mt19937 rng(1);
    ObstacleStream s(rng);
    s.insert({13, 10});
    s.insert({12, 10});
    s.insert({13, 11});
    s.insert({13, 10});

    auto hits = s.collide(13, 10);
    CHECK(hits.size() == 2);
    REQUIRE(s.size() == 2);
    CHECK(s.obstacles()[0].row == 12);
    CHECK(s.obstacles()[1].col == 11);

    CHECK(s.collide(13, 10).empty());
    CHECK(s.size() == 2);
}

TEST_CASE("tick spawns, advances, then tests collisions", "[obstacles]") {
    std::mt19937 rng(1);
    ObstacleStream s(rng);
    s.insert({13, 12});

    // speed 2 lands it on the player this tick
    auto hits = s.tick(0.0, 2, 15, 40, 13, 10);
    REQUIRE(hits.size() == 1);
    CHECK(hits[0].col == 10);
    CHECK(s.size() == 0);

    // Movement happens before the test: one column away at speed 1 is a hit.
    s.insert({4, 38});
    hits = s.tick(0.0, 1, 15, 40, 4, 37);
    CHECK(hits.size() == 1);
}

TEST_CASE("fast obstacles can skip over the player", "[obstacles]") {
    std::mt19937 rng(1);
    ObstacleStream s(rng);
    s.insert({13, 12});
    CHECK(s.tick(0.0, 3, 15, 40, 13, 10).empty());
    REQUIRE(s.size() == 1);
    CHECK(s.obstacles()[0].col == 9);
}
