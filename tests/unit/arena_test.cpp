#include <gtest/gtest.h>
#include <string>
#include "Arena.hpp"
#include "CollisionSystem.hpp"

class ArenaTest : public ::testing::Test {
protected:
    ArenaConfig smallConfig() {
        ArenaConfig config;
        config.seed = 42;
        config.halfSize = 120.f;
        config.treeCount = 10;
        config.rockCount = 6;
        config.buildingCount = 3;
        config.mountainCount = 1;
        config.verbose = false;
        return config;
    }
};

TEST_F(ArenaTest, GeneratesConfiguredCounts) {
    Arena arena(smallConfig());
    arena.generate();

    EXPECT_EQ(arena.count(EntityKind::Tree), 10u);
    EXPECT_EQ(arena.count(EntityKind::Rock), 6u);
    EXPECT_EQ(arena.count(EntityKind::Building), 3u);
    // 山芯加六个山脚
    EXPECT_EQ(arena.count(EntityKind::Mountain), 7u);
    EXPECT_EQ(arena.size(), 26u);
}

TEST_F(ArenaTest, SameSeedSameLayout) {
    Arena a(smallConfig());
    Arena b(smallConfig());
    a.generate();
    b.generate();

    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_FLOAT_EQ(a.getColliders()[i]->getPosition().x, b.getColliders()[i]->getPosition().x);
        EXPECT_FLOAT_EQ(a.getColliders()[i]->getPosition().z, b.getColliders()[i]->getPosition().z);
    }
}

TEST_F(ArenaTest, RegenerateReplacesLayout) {
    Arena arena(smallConfig());
    arena.generate();
    arena.generate();

    EXPECT_EQ(arena.size(), 26u);
}

TEST_F(ArenaTest, TreeSitsOnGround) {
    Arena arena(smallConfig());
    StaticCollider &tree = arena.addTree({5.f, 0.f, 5.f}, 1.5f);

    auto shape = tree.getShape();
    ASSERT_TRUE(std::holds_alternative<SphereShape>(shape));
    EXPECT_FLOAT_EQ(std::get<SphereShape>(shape).radius, 1.5f);
    EXPECT_FLOAT_EQ(tree.getPosition().y, 1.5f);
    EXPECT_EQ(tree.getKind(), EntityKind::Tree);
}

TEST_F(ArenaTest, BuildingCentredAtHalfHeight) {
    Arena arena(smallConfig());
    StaticCollider &building = arena.addBuilding({0.f, 0.f, 0.f}, {10.f, 12.f, 8.f});

    auto shape = building.getShape();
    ASSERT_TRUE(std::holds_alternative<BoxShape>(shape));
    EXPECT_FLOAT_EQ(building.getPosition().y, 6.f);
    EXPECT_FLOAT_EQ(std::get<BoxShape>(shape).min().y, 0.f);
    EXPECT_FLOAT_EQ(std::get<BoxShape>(shape).halfExtents.x, 5.f);
}

TEST_F(ArenaTest, RegisteredLayoutNeverCollidesWithItself) {
    Arena arena(smallConfig());
    arena.generate();
    CollisionSystem collision;
    arena.registerWith(collision);

    EXPECT_EQ(collision.size(), arena.size());

    collision.checkCollisions();
    EXPECT_EQ(collision.getLastContactCount(), 0u);
}

TEST_F(ArenaTest, SpawnPointIsClear) {
    Arena arena(smallConfig());
    arena.generate();
    CollisionSystem collision;
    arena.registerWith(collision);

    for (int i = 0; i < 10; ++i) {
        sf::Vector3f spawn = arena.findSpawnPoint(collision, 4.f);
        EXPECT_EQ(collision.checkPointCollision(spawn + sf::Vector3f{0.f, 2.f, 0.f}), nullptr);
        EXPECT_FLOAT_EQ(spawn.y, 0.f);
    }
}

TEST_F(ArenaTest, SpawnFallsBackToOriginWhenBlocked) {
    Arena arena(smallConfig());
    arena.addRock({0.f, 0.f, 0.f}, 1000.f);
    CollisionSystem collision;
    arena.registerWith(collision);

    sf::Vector3f spawn = arena.findSpawnPoint(collision, 4.f);

    EXPECT_FLOAT_EQ(spawn.x, 0.f);
    EXPECT_FLOAT_EQ(spawn.z, 0.f);
}

TEST_F(ArenaTest, ClearRemovesColliders) {
    Arena arena(smallConfig());
    arena.generate();
    CollisionSystem collision;
    arena.registerWith(collision);

    arena.clear();

    EXPECT_EQ(arena.size(), 0u);
    EXPECT_EQ(collision.size(), 0u);
}

TEST_F(ArenaTest, QuietGenerationPrintsNothing) {
    Arena arena(smallConfig());

    testing::internal::CaptureStdout();
    arena.generate();
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "");

    ArenaConfig loud = smallConfig();
    loud.verbose = true;
    Arena reported(loud);

    testing::internal::CaptureStdout();
    reported.generate();
    EXPECT_NE(testing::internal::GetCapturedStdout().find("[Arena] Generated"), std::string::npos);
}

TEST_F(ArenaTest, RegisteringWithSecondSystemFails) {
    Arena arena(smallConfig());
    arena.generate();
    CollisionSystem first;
    CollisionSystem second;

    EXPECT_TRUE(arena.registerWith(first));
    EXPECT_FALSE(arena.registerWith(second));
    EXPECT_EQ(second.size(), 0u);
    EXPECT_EQ(first.size(), arena.size());
}
