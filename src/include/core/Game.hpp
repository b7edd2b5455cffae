#pragma once

#include <SFML/System/Clock.hpp>
#include <memory>
#include <vector>
#include "Arena.hpp"
#include "CollisionSystem.hpp"
#include "CombatEvents.hpp"
#include "Config.hpp"
#include "EffectScheduler.hpp"
#include "Enemy.hpp"
#include "Scene.hpp"
#include "Shell.hpp"
#include "Tank.hpp"
#include "WorldContext.hpp"

// 无头主循环：每 tick 依次 坦克更新/开火 -> 炮弹推进 -> 碰撞检测 -> 特效帧 -> 复活
class Game
{
public:
  explicit Game(const GameConfig &config = GameConfig{});

  bool init();

  // 跑满 maxTicks
  void run();

  // 单步一个 tick
  void step();

  int getTick() const { return m_tick; }
  int getPlayerKills() const { return m_playerKills; }
  int getPlayerDeaths() const { return m_playerDeaths; }
  int getNpcKills() const { return m_npcKills; }

  Tank *getPlayer() const { return m_player.get(); }
  const std::vector<std::unique_ptr<Enemy>> &getEnemies() const { return m_enemies; }
  const ShellManager &getShells() const { return m_shells; }
  const CollisionSystem &getCollisionSystem() const { return m_collision; }
  const Arena &getArena() const { return m_arena; }
  const Scene &getScene() const { return m_scene; }
  CombatEvents &getEvents() { return m_events; }

private:
  void setupEventCallbacks();
  void spawnTanks();
  void updateTanks();
  void updateRespawns();
  void handleTankHit(const TargetHitEvent &event);
  void handleTankDestroyed(const TargetDestroyedEvent &event);

  // 离玩家最近的存活 NPC
  Enemy *findNearestEnemy() const;

  Tank *asTank(const Collidable *collidable) const;

  // 等待复活的坦克
  struct PendingRespawn
  {
    Tank *tank;
    int ticksLeft;
  };

  GameConfig m_config;

  // 声明顺序即析构逆序：场景最后销毁
  Scene m_scene;
  EffectScheduler m_effects;
  CombatEvents m_events;
  CollisionSystem m_collision;
  WorldContext m_world;

  Arena m_arena;
  ShellManager m_shells;
  std::unique_ptr<Tank> m_player;
  std::vector<std::unique_ptr<Enemy>> m_enemies;

  std::vector<PendingRespawn> m_respawns;

  sf::Clock m_clock;
  int m_tick = 0;
  int m_playerKills = 0;
  int m_playerDeaths = 0;
  int m_npcKills = 0;
  int m_shotsFired = 0;
  bool m_initialized = false;
};
