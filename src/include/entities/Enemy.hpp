#pragma once

#include <random>
#include <vector>
#include "Tank.hpp"

// NPC 坦克：在射程内瞄准目标并随机开火
class Enemy : public Tank
{
public:
  Enemy(const WorldContext &world, std::string callsign, sf::Vector3f position,
        const TankConfig &tankConfig = TankConfig{}, const NpcConfig &npcConfig = NpcConfig{},
        unsigned int seed = 0, const ExplosionConfig &explosion = ExplosionConfig{});

  // 设置追踪目标（为空则只空转炮塔）
  void setTarget(const Tank *target) { m_target = target; }
  const Tank *getTarget() const { return m_target; }

  // 每 tick：装填、瞄准、决定是否开火
  Shell *think(ShellManager &shells);

  bool isNpc() const override { return true; }

  // 目标是否在射程内
  bool isTargetInRange() const;

private:
  NpcConfig m_npcConfig;
  const Tank *m_target = nullptr;
  std::mt19937 m_rng;
  int m_idleTimer = 0;
};
