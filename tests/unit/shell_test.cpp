#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "CollisionSystem.hpp"
#include "CombatEvents.hpp"
#include "EffectScheduler.hpp"
#include "Shell.hpp"
#include "StaticCollider.hpp"
#include "Tank.hpp"

class ShellTest : public ::testing::Test {
protected:
    Scene scene;
    EffectScheduler effects{11};
    CombatEvents events;
    WorldContext world{&scene, &effects, &events, nullptr};

    // 发射者不带场景，避免坦克模型计入可视对象
    Tank owner{WorldContext{}, "alpha", {0.f, 0.f, -100.f}};

    ShellConfig flatConfig() {
        ShellConfig config;
        config.gravity = 0.f;
        return config;
    }
};

TEST_F(ShellTest, DirectionIsNormalized) {
    Shell shell(world, {0.f, 10.f, 0.f}, {0.f, 0.f, 2.f}, 3.f, &owner);

    EXPECT_FLOAT_EQ(shell.getDirection().z, 1.f);
    EXPECT_FLOAT_EQ(shell.getVelocity().z, 3.f);
    EXPECT_FLOAT_EQ(shell.getVelocity().y, 0.f);
    EXPECT_EQ(shell.getState(), ShellState::Flying);
    EXPECT_TRUE(shell.hasVisuals());
}

TEST_F(ShellTest, GravityAppliedBeforeMove) {
    Shell shell(world, {0.f, 10.f, 0.f}, {1.f, 0.f, 0.f}, 1.f, &owner);

    ASSERT_TRUE(shell.update());

    EXPECT_FLOAT_EQ(shell.getVelocity().y, -0.01f);
    EXPECT_FLOAT_EQ(shell.getPosition().x, 1.f);
    EXPECT_FLOAT_EQ(shell.getPosition().y, 9.99f);
    EXPECT_EQ(shell.getAge(), 1);
}

TEST_F(ShellTest, BallisticPathOverManyTicks) {
    // 斜向上发射：每 tick 先减速度再位移，高度是各 tick 速度的累加
    Shell shell(world, {0.f, 10.f, 0.f}, {3.f, 4.f, 0.f}, 1.f, &owner);
    const float g = 0.01f;
    const float vy0 = 0.8f;

    float expectedY = 10.f;
    for (int k = 1; k <= 10; ++k) {
        ASSERT_TRUE(shell.update()) << "tick " << k;
        expectedY += vy0 - k * g;

        EXPECT_NEAR(shell.getVelocity().y, vy0 - k * g, 1e-5f) << "tick " << k;
        EXPECT_NEAR(shell.getPosition().y, expectedY, 1e-4f) << "tick " << k;
        EXPECT_NEAR(shell.getPosition().x, 0.6f * k, 1e-4f) << "tick " << k;
    }

    // 闭式解：y = y0 + k·vy0 − g·k(k+1)/2
    EXPECT_NEAR(shell.getPosition().y, 10.f + 10.f * vy0 - g * 55.f, 1e-4f);
    EXPECT_NEAR(shell.getVelocity().y, vy0 - 0.1f, 1e-5f);
    EXPECT_FLOAT_EQ(shell.getVelocity().x, 0.6f);
}

TEST_F(ShellTest, TrailShiftsBackEachTick) {
    Shell shell(world, {0.f, 10.f, 0.f}, {1.f, 0.f, 0.f}, 1.f, &owner, flatConfig());

    for (const auto &point : shell.getTrail())
        EXPECT_FLOAT_EQ(point.x, 0.f);

    shell.update();
    shell.update();

    const auto &trail = shell.getTrail();
    EXPECT_EQ(trail.size(), SHELL_TRAIL_LENGTH);
    EXPECT_FLOAT_EQ(trail[0].x, 2.f);
    EXPECT_FLOAT_EQ(trail[1].x, 1.f);
    EXPECT_FLOAT_EQ(trail[2].x, 0.f);
    EXPECT_FLOAT_EQ(trail[SHELL_TRAIL_LENGTH - 1].x, 0.f);
}

TEST_F(ShellTest, TrailColourFades) {
    Shell shell(world, {0.f, 10.f, 0.f}, {1.f, 0.f, 0.f}, 1.f, &owner);

    EXPECT_EQ(shell.getTrailColor(0).r, 255);
    EXPECT_EQ(shell.getTrailColor(0).g, 178);
    EXPECT_EQ(shell.getTrailColor(0).b, 76);

    for (std::size_t i = 1; i < SHELL_TRAIL_LENGTH; ++i)
        EXPECT_LE(shell.getTrailColor(i).b, shell.getTrailColor(i - 1).b);
    EXPECT_LT(shell.getTrailColor(SHELL_TRAIL_LENGTH - 1).b, 20);
}

TEST_F(ShellTest, ExpiresAtMaxLifetime) {
    Shell shell(world, {0.f, 10.f, 0.f}, {1.f, 0.f, 0.f}, 1.f, &owner, flatConfig());

    for (int tick = 1; tick < 600; ++tick)
        ASSERT_TRUE(shell.update()) << "tick " << tick;

    EXPECT_FALSE(shell.update());
    EXPECT_EQ(shell.getAge(), 600);
    EXPECT_EQ(shell.getState(), ShellState::Expired);
    EXPECT_FALSE(shell.isAlive());

    // 超时不再移动，小爆炸留在最后位置
    EXPECT_FLOAT_EQ(shell.getPosition().x, 599.f);
    EXPECT_EQ(effects.size(), 1u);
    EXPECT_EQ(scene.count(VisualKind::Particles), 1u);
    EXPECT_FALSE(shell.hasVisuals());
}

TEST_F(ShellTest, UpwardShotStillExpires) {
    ShellConfig config;
    config.maxLifetime = 50;
    Shell shell(world, {0.f, 1.f, 0.f}, {0.f, 1.f, 0.f}, 2.f, &owner, config);

    int ticks = 0;
    while (shell.update())
        ++ticks;

    EXPECT_EQ(ticks, 49);
    EXPECT_EQ(shell.getState(), ShellState::Expired);
}

TEST_F(ShellTest, GroundHitExplodesAtProjection) {
    Shell shell(world, {0.f, 0.005f, 0.f}, {1.f, 0.f, 0.f}, 1.f, &owner);

    EXPECT_FALSE(shell.update());
    EXPECT_EQ(shell.getState(), ShellState::GroundHit);
    EXPECT_FALSE(shell.hasVisuals());

    // 模型和尾迹之后创建的第三个对象是爆炸
    const Visual *explosion = scene.find(3);
    ASSERT_NE(explosion, nullptr);
    EXPECT_EQ(explosion->kind, VisualKind::Particles);
    EXPECT_FLOAT_EQ(explosion->position.x, 1.f);
    EXPECT_FLOAT_EQ(explosion->position.y, 0.f);
    EXPECT_EQ(scene.size(), 1u);
}

TEST_F(ShellTest, ExactlyZeroHeightIsNotGroundHit) {
    Shell shell(world, {0.f, 0.01f, 0.f}, {1.f, 0.f, 0.f}, 1.f, &owner);

    EXPECT_TRUE(shell.update());
    EXPECT_FLOAT_EQ(shell.getPosition().y, 0.f);
    EXPECT_FALSE(shell.update());
    EXPECT_EQ(shell.getState(), ShellState::GroundHit);
}

TEST_F(ShellTest, CollisionWithOwnerIgnored) {
    Shell shell(world, {0.f, 0.f, -100.f}, {0.f, 0.f, 1.f}, 1.f, &owner);

    shell.onCollision(owner);

    EXPECT_TRUE(shell.isAlive());
    EXPECT_EQ(shell.getResolvedHits(), 0);
    EXPECT_FLOAT_EQ(owner.getHealth(), 100.f);
}

TEST_F(ShellTest, StaticHitOnlyExplodes) {
    StaticCollider tree({0.f, 5.f, 0.f}, EntityKind::Tree, 1.f);
    Shell shell(world, {0.f, 5.f, 0.f}, {0.f, 0.f, 1.f}, 1.f, &owner);

    shell.onCollision(tree);

    EXPECT_FALSE(shell.isActive());
    EXPECT_EQ(shell.getState(), ShellState::TargetHit);
    EXPECT_EQ(shell.getResolvedHits(), 1);
    EXPECT_EQ(events.getHitCount(), 0);
    EXPECT_EQ(effects.size(), 1u);
    EXPECT_FALSE(shell.hasVisuals());
}

TEST_F(ShellTest, TankHitDealsDamageAndNotifies) {
    Tank target(WorldContext{}, "bravo", {0.f, 0.f, 0.f});
    Shell shell(world, {0.f, 1.f, 0.f}, {0.f, 0.f, 1.f}, 1.f, &owner);

    const Collidable *hitSource = nullptr;
    events.setOnTargetHit([&](const TargetHitEvent &e) {
        EXPECT_EQ(e.target, &target);
        EXPECT_FLOAT_EQ(e.damageAmount, 25.f);
        hitSource = e.source;
    });

    shell.onCollision(target);

    EXPECT_FLOAT_EQ(target.getHealth(), 75.f);
    EXPECT_EQ(hitSource, &owner);
    EXPECT_EQ(events.getHitCount(), 1);
    EXPECT_EQ(events.getDestroyedCount(), 0);
}

TEST_F(ShellTest, SecondCollisionIsIgnored) {
    Tank target(WorldContext{}, "bravo", {0.f, 0.f, 0.f});
    Tank other(WorldContext{}, "charlie", {0.f, 0.f, 1.f});
    Shell shell(world, {0.f, 1.f, 0.f}, {0.f, 0.f, 1.f}, 1.f, &owner);

    shell.onCollision(target);
    shell.onCollision(other);

    EXPECT_EQ(shell.getResolvedHits(), 1);
    EXPECT_FLOAT_EQ(other.getHealth(), 100.f);
    EXPECT_EQ(events.getHitCount(), 1);
}

TEST_F(ShellTest, KillingBlowEmitsDestroyedBeforeHit) {
    Tank target(WorldContext{}, "bravo", {0.f, 0.f, 0.f});
    target.takeDamage(75.f);
    Shell shell(world, {0.f, 1.f, 0.f}, {0.f, 0.f, 1.f}, 1.f, &owner);

    std::vector<std::string> order;
    events.setOnTargetDestroyed([&](const TargetDestroyedEvent &e) {
        EXPECT_EQ(e.source, &owner);
        order.push_back("destroyed");
    });
    events.setOnTargetHit([&](const TargetHitEvent &) { order.push_back("hit"); });

    shell.onCollision(target);

    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], "destroyed");
    EXPECT_EQ(order[1], "hit");
    EXPECT_TRUE(target.isDestroyed());
}

TEST_F(ShellTest, UpdateAfterHitDoesNothing) {
    StaticCollider rock({0.f, 5.f, 0.f}, EntityKind::Rock, 1.f);
    Shell shell(world, {0.f, 5.f, 0.f}, {0.f, 0.f, 1.f}, 1.f, &owner);
    shell.onCollision(rock);

    EXPECT_FALSE(shell.update());
    EXPECT_EQ(shell.getAge(), 0);
    EXPECT_FLOAT_EQ(shell.getPosition().z, 0.f);
}

TEST_F(ShellTest, OwnerIdentity) {
    Shell owned(world, {0.f, 5.f, 0.f}, {0.f, 0.f, 1.f}, 1.f, &owner);
    Shell orphan(world, {0.f, 5.f, 0.f}, {0.f, 0.f, 1.f}, 1.f, nullptr);

    EXPECT_EQ(owned.getOwnerId(), "alpha");
    EXPECT_EQ(owned.getOwner(), &owner);
    EXPECT_EQ(orphan.getOwnerId(), "unknown");
}

TEST_F(ShellTest, HeadlessShellHasNoVisuals) {
    Shell shell(WorldContext{}, {0.f, 0.005f, 0.f}, {1.f, 0.f, 0.f}, 1.f, &owner);

    EXPECT_FALSE(shell.hasVisuals());
    EXPECT_FALSE(shell.update());
    EXPECT_EQ(shell.getState(), ShellState::GroundHit);
}
