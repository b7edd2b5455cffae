#pragma once

#include <SFML/System/Vector3.hpp>
#include <string>
#include "Collidable.hpp"
#include "Config.hpp"
#include "HealthBar.hpp"
#include "Scene.hpp"
#include "WorldContext.hpp"

class Shell;
class ShellManager;

class Tank : public Collidable, public Damageable
{
public:
  Tank(const WorldContext &world, std::string callsign, sf::Vector3f position,
       const TankConfig &config = TankConfig{}, const ExplosionConfig &explosion = ExplosionConfig{});

  // 每 tick 更新装填
  virtual void update();

  // 装填完成且未被击毁时开火，否则返回 nullptr
  Shell *fire(ShellManager &shells);
  bool canFire() const { return m_reloadCounter >= m_reloadTicks && !isDestroyed(); }

  // 移动（记录上一位置，碰撞时回退）
  void move(sf::Vector3f delta);
  void setPosition(sf::Vector3f position);

  float getHullRotation() const { return m_hullAngle; }
  void setHullRotation(float radians) { m_hullAngle = radians; }
  float getTurretRotation() const { return m_turretAngle; }
  void setTurretRotation(float radians) { m_turretAngle = radians; }
  float getBarrelElevation() const { return m_barrelElevation; }
  void setBarrelElevation(float radians); // 限制在 [min, max]

  // 朝目标转动炮塔和炮管（每 tick 有转速上限）
  void aimAt(sf::Vector3f target);

  // 炮口位置与发射方向
  sf::Vector3f getGunPosition() const;
  sf::Vector3f getFiringDirection() const;

  // 复活：满血、回到指定位置
  void respawn(sf::Vector3f position);

  const std::string &getCallsign() const { return m_callsign; }
  virtual bool isNpc() const { return false; }

  const HealthBar &getHealthBar() const { return m_healthBar; }

  // Collidable
  CollisionShape getShape() const override { return SphereShape{m_position, m_config.collisionRadius}; }
  sf::Vector3f getPosition() const override { return m_position; }
  EntityKind getKind() const override { return EntityKind::Tank; }
  void onCollision(Collidable &other) override;
  Damageable *asDamageable() override { return this; }
  std::string getName() const override { return m_callsign; }

  // Damageable
  bool takeDamage(float amount) override;
  float getHealth() const override { return m_healthBar.getHealth(); }
  bool isDestroyed() const override { return m_destroyed; }

protected:
  // 开火用的炮弹速度与装填时间（NPC 覆盖）
  void setShellSpeed(float speed) { m_shellSpeed = speed; }
  void setReloadTicks(int ticks) { m_reloadTicks = ticks; }

  WorldContext m_world;
  TankConfig m_config;

private:
  void createDestroyedEffect();

  ExplosionConfig m_explosionConfig; // 击毁时的爆炸
  std::string m_callsign;
  HealthBar m_healthBar;
  VisualHandle m_mesh;

  sf::Vector3f m_position;
  sf::Vector3f m_lastPosition;

  // 角度（弧度）
  float m_hullAngle = 0.f;
  float m_turretAngle = 0.f;
  float m_barrelElevation = 0.f;

  int m_reloadTicks;
  int m_reloadCounter;
  float m_shellSpeed;

  bool m_destroyed = false;
};
