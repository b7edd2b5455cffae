#include "Game.hpp"
#include "Utils.hpp"
#include <SFML/System/Sleep.hpp>
#include <SFML/System/Time.hpp>
#include <algorithm>
#include <iostream>
#include <limits>
#include <string>
#include <utility>

namespace
{
  // 场地日志跟随游戏的 verbose 开关
  ArenaConfig arenaConfigFor(const GameConfig &config)
  {
    ArenaConfig arena = config.arena;
    arena.verbose = arena.verbose && config.verbose;
    return arena;
  }
}

Game::Game(const GameConfig &config)
    : m_config(config),
      m_effects(config.arena.seed),
      m_world{&m_scene, &m_effects, &m_events, &m_collision},
      m_arena(arenaConfigFor(config)),
      m_shells(m_world, config.shell, config.explosion)
{
}

bool Game::init()
{
  if (m_initialized)
    return true;

  if (m_config.tickRate <= 0 || m_config.maxTicks < 0 || m_config.npcCount < 0)
  {
    std::cerr << "[Game] Invalid configuration (tickRate " << m_config.tickRate
              << ", maxTicks " << m_config.maxTicks << ", npcCount " << m_config.npcCount << ")" << std::endl;
    return false;
  }

  // 先生成场地并登记，出生点检测依赖它
  m_arena.generate();
  if (!m_arena.registerWith(m_collision))
  {
    std::cerr << "[Game] Failed to register arena colliders" << std::endl;
    return false;
  }

  setupEventCallbacks();
  spawnTanks();

  m_initialized = true;

  if (m_config.verbose)
  {
    std::cout << "[Game] Initialized: " << m_collision.size() << " colliders, "
              << m_enemies.size() << " NPC tanks" << std::endl;
  }
  return true;
}

void Game::spawnTanks()
{
  const float clearance = m_config.tank.collisionRadius * 2.f;

  m_player = std::make_unique<Tank>(m_world, "player",
                                    m_arena.findSpawnPoint(m_collision, clearance),
                                    m_config.tank, m_config.explosion);
  m_collision.addCollider(*m_player);

  for (int i = 0; i < m_config.npcCount; ++i)
  {
    auto enemy = std::make_unique<Enemy>(m_world, "npc-" + std::to_string(i + 1),
                                         m_arena.findSpawnPoint(m_collision, clearance),
                                         m_config.tank, m_config.npc,
                                         m_config.arena.seed + static_cast<unsigned int>(i) + 1u,
                                         m_config.explosion);
    enemy->setTarget(m_player.get());
    m_collision.addCollider(*enemy);
    m_enemies.push_back(std::move(enemy));
  }
}

void Game::setupEventCallbacks()
{
  m_events.setOnTargetHit([this](const TargetHitEvent &event)
                          { handleTankHit(event); });
  m_events.setOnTargetDestroyed([this](const TargetDestroyedEvent &event)
                                { handleTankDestroyed(event); });
}

void Game::run()
{
  if (!m_initialized && !init())
    return;

  const sf::Time frameTime = sf::seconds(1.f / static_cast<float>(m_config.tickRate));
  m_clock.restart();

  sf::Clock frameClock;
  while (m_tick < m_config.maxTicks)
  {
    frameClock.restart();
    step();

    // 实时模式按 tickRate 限速
    if (m_config.realTime)
    {
      sf::Time elapsed = frameClock.getElapsedTime();
      if (elapsed < frameTime)
        sf::sleep(frameTime - elapsed);
    }
  }

  if (m_config.verbose)
  {
    std::cout << "[Game] Finished " << m_tick << " ticks in "
              << m_clock.getElapsedTime().asSeconds() << "s: "
              << m_shotsFired << " shells fired, "
              << m_events.getHitCount() << " hits, "
              << m_playerKills << " kills, "
              << m_playerDeaths << " deaths" << std::endl;
  }
}

void Game::step()
{
  if (!m_initialized)
    return;

  // 先开火，再推进炮弹，然后碰撞，最后特效帧
  updateTanks();
  m_shells.advanceAll();
  m_collision.checkCollisions();
  m_effects.update();
  updateRespawns();

  ++m_tick;
}

void Game::updateTanks()
{
  if (m_player && !m_player->isDestroyed())
  {
    m_player->update();

    // 自动瞄准最近的 NPC
    if (Enemy *target = findNearestEnemy())
    {
      m_player->aimAt(target->getPosition());
      if (m_player->fire(m_shells))
        ++m_shotsFired;
    }
  }

  for (auto &enemy : m_enemies)
  {
    if (enemy->think(m_shells))
      ++m_shotsFired;
  }
}

void Game::updateRespawns()
{
  const float clearance = m_config.tank.collisionRadius * 2.f;

  for (auto &pending : m_respawns)
  {
    if (--pending.ticksLeft > 0)
      continue;

    pending.tank->respawn(m_arena.findSpawnPoint(m_collision, clearance));

    if (m_config.verbose)
    {
      std::cout << "[Game] " << pending.tank->getCallsign() << " respawned at ("
                << pending.tank->getPosition().x << ", " << pending.tank->getPosition().z << ")" << std::endl;
    }
  }

  m_respawns.erase(std::remove_if(m_respawns.begin(), m_respawns.end(),
                                  [](const PendingRespawn &p)
                                  { return p.ticksLeft <= 0; }),
                   m_respawns.end());
}

void Game::handleTankHit(const TargetHitEvent &event)
{
  Tank *target = asTank(event.target);
  if (!target || !m_config.verbose)
    return;

  const Tank *source = asTank(event.source);
  std::cout << "[Combat] " << (source ? source->getCallsign() : std::string("unknown"))
            << " hit " << target->getCallsign() << " for " << event.damageAmount
            << " (health " << target->getHealth() << ")" << std::endl;
}

void Game::handleTankDestroyed(const TargetDestroyedEvent &event)
{
  Tank *target = asTank(event.target);
  if (!target)
    return;

  const Tank *source = asTank(event.source);

  if (target == m_player.get())
  {
    ++m_playerDeaths;
    if (source && source->isNpc())
      ++m_npcKills;
    m_respawns.push_back({target, m_config.playerRespawnTicks});
  }
  else
  {
    if (source == m_player.get())
      ++m_playerKills;
    m_respawns.push_back({target, m_config.npcRespawnTicks});
  }

  if (m_config.verbose)
  {
    std::cout << "[Combat] " << target->getCallsign() << " destroyed by "
              << (source ? source->getCallsign() : std::string("unknown"))
              << " (kills " << m_playerKills << ", deaths " << m_playerDeaths << ")" << std::endl;
  }
}

Enemy *Game::findNearestEnemy() const
{
  if (!m_player)
    return nullptr;

  Enemy *nearest = nullptr;
  float bestDistSq = std::numeric_limits<float>::max();

  for (const auto &enemy : m_enemies)
  {
    if (enemy->isDestroyed())
      continue;

    float distSq = Utils::distanceSquared(m_player->getPosition(), enemy->getPosition());
    if (distSq < bestDistSq)
    {
      bestDistSq = distSq;
      nearest = enemy.get();
    }
  }

  return nearest;
}

Tank *Game::asTank(const Collidable *collidable) const
{
  if (!collidable || collidable->getKind() != EntityKind::Tank)
    return nullptr;

  if (collidable == m_player.get())
    return m_player.get();

  for (const auto &enemy : m_enemies)
  {
    if (collidable == enemy.get())
      return enemy.get();
  }
  return nullptr;
}
