#include "Tank.hpp"
#include "EffectScheduler.hpp"
#include "Explosion.hpp"
#include "Shell.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

Tank::Tank(const WorldContext &world, std::string callsign, sf::Vector3f position,
           const TankConfig &config, const ExplosionConfig &explosion)
    : m_world(world), m_config(config), m_explosionConfig(explosion), m_callsign(std::move(callsign)),
      m_healthBar(config.maxHealth), m_position(position), m_lastPosition(position),
      m_reloadTicks(config.reloadTicks), m_reloadCounter(config.reloadTicks),
      m_shellSpeed(config.shellSpeed)
{
  if (m_world.scene)
    m_mesh = m_world.scene->add(VisualKind::Mesh, position);
}

void Tank::update()
{
  if (m_destroyed)
    return;

  if (m_reloadCounter < m_reloadTicks)
    ++m_reloadCounter;
}

Shell *Tank::fire(ShellManager &shells)
{
  if (!canFire())
    return nullptr;

  m_reloadCounter = 0;
  return &shells.spawn(getGunPosition(), getFiringDirection(), m_shellSpeed, this);
}

void Tank::move(sf::Vector3f delta)
{
  if (m_destroyed)
    return;

  m_lastPosition = m_position;
  m_position += delta;
  m_mesh.setPosition(m_position);
}

void Tank::setPosition(sf::Vector3f position)
{
  m_position = position;
  m_lastPosition = position;
  m_mesh.setPosition(position);
}

void Tank::setBarrelElevation(float radians)
{
  m_barrelElevation = std::clamp(radians, m_config.minBarrelElevation, m_config.maxBarrelElevation);
}

void Tank::aimAt(sf::Vector3f target)
{
  sf::Vector3f diff = target - m_position;

  // 炮塔角度相对车身
  float targetTurret = Utils::wrapAngle(std::atan2(diff.x, diff.z) - m_hullAngle);
  float turretDiff = Utils::wrapAngle(targetTurret - m_turretAngle);
  float turretStep = std::min(std::abs(turretDiff), m_config.turretRotationSpeed);
  m_turretAngle = Utils::wrapAngle(m_turretAngle + (turretDiff > 0.f ? turretStep : -turretStep));

  // 粗略俯仰角（负值为抬起）
  float horizontal = std::sqrt(diff.x * diff.x + diff.z * diff.z);
  float targetElevation = std::clamp(-std::atan2(diff.y, horizontal),
                                     m_config.minBarrelElevation, m_config.maxBarrelElevation);
  m_barrelElevation = Utils::approach(m_barrelElevation, targetElevation, m_config.barrelElevationSpeed);
}

sf::Vector3f Tank::getGunPosition() const
{
  sf::Vector3f offset{0.f, 0.f, m_config.barrelOffset};
  offset = Utils::rotateX(offset, m_barrelElevation);
  offset = Utils::rotateY(offset, m_turretAngle + m_hullAngle);
  return m_position + sf::Vector3f{0.f, m_config.turretHeight, 0.f} + offset;
}

sf::Vector3f Tank::getFiringDirection() const
{
  sf::Vector3f direction{0.f, 0.f, 1.f};
  direction = Utils::rotateX(direction, m_barrelElevation);
  direction = Utils::rotateY(direction, m_turretAngle + m_hullAngle);
  return direction;
}

void Tank::respawn(sf::Vector3f position)
{
  m_healthBar.setHealth(m_healthBar.getMaxHealth());
  m_destroyed = false;
  m_reloadCounter = m_reloadTicks;
  setPosition(position);
}

void Tank::onCollision(Collidable &other)
{
  // 炮弹的伤害由炮弹自己结算
  if (other.getKind() == EntityKind::Shell)
    return;

  // 撞到障碍物或其他坦克，退回上一位置
  m_position = m_lastPosition;
  m_mesh.setPosition(m_position);
}

bool Tank::takeDamage(float amount)
{
  if (m_destroyed)
    return false;

  m_healthBar.setHealth(m_healthBar.getHealth() - amount);

  if (m_healthBar.isDead())
  {
    m_destroyed = true;
    createDestroyedEffect();
    return true;
  }

  return false;
}

void Tank::createDestroyedEffect()
{
  if (!m_world.effects || !m_world.scene)
    return;

  spawnExplosion(*m_world.effects, *m_world.scene, m_position, 2.f, m_explosionConfig);
}
