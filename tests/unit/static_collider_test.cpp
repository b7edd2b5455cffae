#include <gtest/gtest.h>
#include "StaticCollider.hpp"

TEST(StaticColliderTest, RadiusGivesSphere) {
    StaticCollider tree({1.f, 2.f, 3.f}, EntityKind::Tree, 1.5f);

    auto shape = tree.getShape();
    ASSERT_TRUE(std::holds_alternative<SphereShape>(shape));
    EXPECT_FLOAT_EQ(std::get<SphereShape>(shape).radius, 1.5f);
    EXPECT_FLOAT_EQ(std::get<SphereShape>(shape).center.z, 3.f);
}

TEST(StaticColliderTest, SizeGivesBox) {
    StaticCollider building({0.f, 5.f, 0.f}, EntityKind::Building, std::nullopt, sf::Vector3f{10.f, 10.f, 6.f});

    auto shape = building.getShape();
    ASSERT_TRUE(std::holds_alternative<BoxShape>(shape));
    EXPECT_FLOAT_EQ(std::get<BoxShape>(shape).halfExtents.x, 5.f);
    EXPECT_FLOAT_EQ(std::get<BoxShape>(shape).halfExtents.z, 3.f);
}

TEST(StaticColliderTest, RadiusTakesPriorityOverSize) {
    StaticCollider rock({0.f, 0.f, 0.f}, EntityKind::Rock, 2.f, sf::Vector3f{4.f, 4.f, 4.f});

    EXPECT_TRUE(std::holds_alternative<SphereShape>(rock.getShape()));
}

TEST(StaticColliderTest, DefaultsToUnitSphere) {
    StaticCollider rock({0.f, 0.f, 0.f}, EntityKind::Rock);

    auto shape = rock.getShape();
    ASSERT_TRUE(std::holds_alternative<SphereShape>(shape));
    EXPECT_FLOAT_EQ(std::get<SphereShape>(shape).radius, 1.f);
}

TEST(StaticColliderTest, ReportsKindAndPosition) {
    StaticCollider mountain({-40.f, 80.f, 12.f}, EntityKind::Mountain, 60.f);

    EXPECT_EQ(mountain.getKind(), EntityKind::Mountain);
    EXPECT_FLOAT_EQ(mountain.getPosition().x, -40.f);
    EXPECT_FLOAT_EQ(mountain.getPosition().y, 80.f);
    EXPECT_TRUE(mountain.isActive());
    EXPECT_EQ(mountain.getOwner(), nullptr);
    EXPECT_EQ(mountain.asDamageable(), nullptr);
    EXPECT_EQ(mountain.getName(), "mountain");
}

TEST(StaticColliderTest, StaticKinds) {
    EXPECT_TRUE(isStaticKind(EntityKind::Tree));
    EXPECT_TRUE(isStaticKind(EntityKind::Rock));
    EXPECT_TRUE(isStaticKind(EntityKind::Building));
    EXPECT_TRUE(isStaticKind(EntityKind::Mountain));
    EXPECT_FALSE(isStaticKind(EntityKind::Shell));
    EXPECT_FALSE(isStaticKind(EntityKind::Tank));
    EXPECT_FALSE(isStaticKind(EntityKind::Unknown));
}
