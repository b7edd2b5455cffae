#include "Enemy.hpp"
#include "Shell.hpp"
#include "Utils.hpp"
#include <cmath>
#include <utility>

Enemy::Enemy(const WorldContext &world, std::string callsign, sf::Vector3f position,
             const TankConfig &tankConfig, const NpcConfig &npcConfig, unsigned int seed,
             const ExplosionConfig &explosion)
    : Tank(world, std::move(callsign), position, tankConfig, explosion),
      m_npcConfig(npcConfig), m_rng(seed)
{
  // NPC 装填更慢、炮弹更慢
  setReloadTicks(npcConfig.reloadTicks);
  setShellSpeed(npcConfig.shellSpeed);
}

bool Enemy::isTargetInRange() const
{
  if (!m_target || m_target->isDestroyed())
    return false;
  return Utils::distance(getPosition(), m_target->getPosition()) < m_npcConfig.targetingDistance;
}

Shell *Enemy::think(ShellManager &shells)
{
  update();

  if (isDestroyed())
    return nullptr;

  ++m_idleTimer;

  if (isTargetInRange())
  {
    aimAt(m_target->getPosition());

    std::uniform_real_distribution<float> chance(0.f, 1.f);
    if (canFire() && chance(m_rng) < m_npcConfig.fireProbability)
      return fire(shells);
  }
  else
  {
    // 没有目标时缓慢转动炮塔
    float sway = std::sin(static_cast<float>(m_idleTimer) * 0.01f) * 0.5f;
    setTurretRotation(Utils::wrapAngle(getTurretRotation() + sway * m_config.turretRotationSpeed));
  }

  return nullptr;
}
