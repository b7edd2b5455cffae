#include "Shell.hpp"
#include "CollisionSystem.hpp"
#include "CombatEvents.hpp"
#include "EffectScheduler.hpp"
#include "Explosion.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>

const char *toString(ShellState state)
{
  switch (state)
  {
  case ShellState::Flying:
    return "flying";
  case ShellState::Expired:
    return "expired";
  case ShellState::GroundHit:
    return "ground-hit";
  case ShellState::TargetHit:
    return "target-hit";
  default:
    return "unknown";
  }
}

Shell::Shell(const WorldContext &world, sf::Vector3f position, sf::Vector3f direction, float speed,
             const Collidable *owner, const ShellConfig &config, const ExplosionConfig &explosion)
    : m_world(world), m_config(config), m_explosionConfig(explosion),
      m_position(position), m_owner(owner)
{
  m_direction = Utils::normalize(direction);
  m_velocity = m_direction * speed;

  if (m_world.scene)
  {
    m_mesh = m_world.scene->add(VisualKind::Mesh, position);
    m_trailVisual = m_world.scene->add(VisualKind::Trail, position);
  }

  initializeTrail(position);
}

bool Shell::update()
{
  if (!m_active)
    return false;

  ++m_age;

  // 超时：小爆炸后消失
  if (m_age >= m_config.maxLifetime)
  {
    createExplosion(m_position, m_explosionConfig.expirySizeScale);
    destroy(ShellState::Expired);
    if (m_config.verbose)
      std::cout << "[Shell] Expired after " << m_age << " ticks" << std::endl;
    return false;
  }

  // 先更新速度再更新位置
  m_velocity.y -= m_config.gravity;
  m_position += m_velocity;
  m_mesh.setPosition(m_position);

  updateTrail();

  // 落地：在地面投影点爆炸
  if (m_position.y < 0.f)
  {
    sf::Vector3f impact{m_position.x, 0.f, m_position.z};
    createExplosion(impact);
    destroy(ShellState::GroundHit);
    if (m_config.verbose)
      std::cout << "[Shell] Ground hit at (" << impact.x << ", 0, " << impact.z << ")" << std::endl;
    return false;
  }

  return true;
}

void Shell::initializeTrail(sf::Vector3f position)
{
  for (std::size_t i = 0; i < SHELL_TRAIL_LENGTH; ++i)
  {
    m_trail[i] = position;

    // 越靠后蓝色分量越弱
    float alpha = std::pow(m_config.trailFadeRate, static_cast<float>(i));
    m_trailColors[i] = sf::Color(255, static_cast<std::uint8_t>(0.7f * 255.f),
                                 static_cast<std::uint8_t>(0.3f * alpha * 255.f));
  }
}

void Shell::updateTrail()
{
  // 整体后移一格，0 号位为当前位置
  for (std::size_t i = SHELL_TRAIL_LENGTH - 1; i > 0; --i)
  {
    m_trail[i] = m_trail[i - 1];
  }
  m_trail[0] = m_position;

  m_trailVisual.setPosition(m_position);
}

sf::Color Shell::getTrailColor(std::size_t index) const
{
  return m_trailColors[std::min(index, SHELL_TRAIL_LENGTH - 1)];
}

std::string Shell::getOwnerId() const
{
  if (m_owner)
    return m_owner->getName();
  return "unknown";
}

void Shell::onCollision(Collidable &other)
{
  // 不与发射者碰撞；已失效则忽略
  if (&other == m_owner || !m_active)
    return;

  // 立即失效，防止同一轮检测中的第二个碰撞对重复结算
  m_active = false;
  assert(m_resolvedHits == 0 && "shell resolved a second collision");
  ++m_resolvedHits;

  destroy(ShellState::TargetHit);
  createExplosion(m_position);

  applyHit(other);
}

void Shell::applyHit(Collidable &other)
{
  switch (other.getKind())
  {
  case EntityKind::Tank:
  {
    Damageable *target = other.asDamageable();
    if (!target)
      break;

    const float damageAmount = m_config.damage;

    if (m_config.verbose)
    {
      std::cout << "[Shell] " << other.getName() << " hit for " << damageAmount
                << " damage, health before: " << target->getHealth() << std::endl;
    }

    bool destroyed = target->takeDamage(damageAmount);

    if (m_config.verbose)
    {
      std::cout << "[Shell] " << other.getName() << " health after: " << target->getHealth()
                << ", destroyed: " << (destroyed ? "yes" : "no") << std::endl;
    }

    if (m_world.events)
    {
      if (destroyed)
        m_world.events->emitTargetDestroyed({&other, m_owner});

      // 无论是否击毁都通知命中
      m_world.events->emitTargetHit({&other, m_owner, damageAmount});
    }
    break;
  }
  case EntityKind::Shell:
  case EntityKind::Tree:
  case EntityKind::Rock:
  case EntityKind::Building:
  case EntityKind::Mountain:
  case EntityKind::Unknown:
    // 只有爆炸，无伤害
    break;
  }
}

void Shell::destroy(ShellState reason)
{
  m_active = false;
  m_state = reason;

  m_mesh.release();
  m_trailVisual.release();
}

void Shell::createExplosion(sf::Vector3f position, float sizeScale)
{
  if (!m_world.effects || !m_world.scene)
    return;

  spawnExplosion(*m_world.effects, *m_world.scene, position, sizeScale, m_explosionConfig);
}

// ShellManager 实现
ShellManager::ShellManager(const WorldContext &world, const ShellConfig &config, const ExplosionConfig &explosion)
    : m_world(world), m_config(config), m_explosionConfig(explosion)
{
}

Shell &ShellManager::spawn(sf::Vector3f position, sf::Vector3f direction, float speed, const Collidable *owner)
{
  m_shells.push_back(std::make_unique<Shell>(m_world, position, direction, speed, owner,
                                             m_config, m_explosionConfig));
  Shell &shell = *m_shells.back();

  if (m_world.collision)
    m_world.collision->addCollider(shell);

  return shell;
}

std::size_t ShellManager::advanceAll()
{
  for (auto &shell : m_shells)
  {
    // 已命中目标的炮弹不再推进
    if (shell->isAlive())
      shell->update();
  }

  // 移除失效炮弹（先注销再释放）
  auto firstDead = std::stable_partition(m_shells.begin(), m_shells.end(),
                                         [](const std::unique_ptr<Shell> &s)
                                         { return s->isAlive(); });
  for (auto it = firstDead; it != m_shells.end(); ++it)
  {
    if (m_world.collision)
      m_world.collision->removeCollider(**it);
  }
  m_shells.erase(firstDead, m_shells.end());

  return m_shells.size();
}
