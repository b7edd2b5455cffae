#pragma once

#include <SFML/Graphics/Color.hpp>
#include <SFML/System/Vector3.hpp>
#include <array>
#include <memory>
#include <string>
#include <vector>
#include "Collidable.hpp"
#include "Config.hpp"
#include "Scene.hpp"
#include "WorldContext.hpp"

// 炮弹状态
enum class ShellState
{
  Flying,    // 飞行中
  Expired,   // 超过最大存活时间
  GroundHit, // 落地
  TargetHit  // 命中目标
};

const char *toString(ShellState state);

// 炮弹：弹道运动、尾迹、超时、落地与一次性命中结算
class Shell : public Collidable
{
public:
  using Trail = std::array<sf::Vector3f, SHELL_TRAIL_LENGTH>;

  Shell(const WorldContext &world, sf::Vector3f position, sf::Vector3f direction, float speed,
        const Collidable *owner, const ShellConfig &config = ShellConfig{},
        const ExplosionConfig &explosion = ExplosionConfig{});

  // 每 tick 推进，返回 false 表示炮弹已销毁
  bool update();

  // Collidable
  CollisionShape getShape() const override { return SphereShape{m_position, m_config.collisionRadius}; }
  sf::Vector3f getPosition() const override { return m_position; }
  EntityKind getKind() const override { return EntityKind::Shell; }
  void onCollision(Collidable &other) override;
  bool isActive() const override { return m_active; }
  const Collidable *getOwner() const override { return m_owner; }

  bool isAlive() const { return m_active; }
  ShellState getState() const { return m_state; }

  sf::Vector3f getVelocity() const { return m_velocity; }

  // 发射方向（归一化，用于回放/同步）
  sf::Vector3f getDirection() const { return m_direction; }

  int getAge() const { return m_age; }
  int getResolvedHits() const { return m_resolvedHits; }

  const Trail &getTrail() const { return m_trail; }
  sf::Color getTrailColor(std::size_t index) const;

  // 发射者名字，没有发射者时为 "unknown"
  std::string getOwnerId() const;

  bool hasVisuals() const { return m_mesh.isValid() || m_trailVisual.isValid(); }

private:
  void initializeTrail(sf::Vector3f position);
  void updateTrail();

  // 所有退出路径共用：清除标志并释放模型和尾迹
  void destroy(ShellState reason);

  void createExplosion(sf::Vector3f position, float sizeScale = 1.f);

  // 按对方种类结算命中效果
  void applyHit(Collidable &other);

  WorldContext m_world;
  ShellConfig m_config;
  ExplosionConfig m_explosionConfig;

  sf::Vector3f m_position;
  sf::Vector3f m_velocity;
  sf::Vector3f m_direction;

  const Collidable *m_owner;

  bool m_active = true;
  ShellState m_state = ShellState::Flying;
  int m_age = 0;
  int m_resolvedHits = 0;

  Trail m_trail;
  std::array<sf::Color, SHELL_TRAIL_LENGTH> m_trailColors;

  VisualHandle m_mesh;
  VisualHandle m_trailVisual;
};

// 管理所有飞行中的炮弹：登记到碰撞系统、逐 tick 推进、移除失效炮弹
class ShellManager
{
public:
  explicit ShellManager(const WorldContext &world,
                        const ShellConfig &config = ShellConfig{},
                        const ExplosionConfig &explosion = ExplosionConfig{});

  Shell &spawn(sf::Vector3f position, sf::Vector3f direction, float speed, const Collidable *owner);

  // 推进所有炮弹，返回仍存活的数量
  std::size_t advanceAll();

  // 清空所有炮弹
  void clear() { m_shells.clear(); }

  std::size_t size() const { return m_shells.size(); }
  const std::vector<std::unique_ptr<Shell>> &getShells() const { return m_shells; }

  const ShellConfig &getConfig() const { return m_config; }

private:
  WorldContext m_world;
  ShellConfig m_config;
  ExplosionConfig m_explosionConfig;
  std::vector<std::unique_ptr<Shell>> m_shells;
};
