#pragma once

#include <SFML/System/Vector3.hpp>
#include <memory>
#include <random>
#include <vector>
#include "Config.hpp"
#include "StaticCollider.hpp"

class CollisionSystem;

// 战场环境：按种子布置树、岩石、建筑、山体的静态碰撞体
// 只生成碰撞体，不生成网格
class Arena
{
public:
  explicit Arena(const ArenaConfig &config = ArenaConfig{});

  // 按配置重新生成
  void generate();

  // 手动添加（测试或自定义地图用）
  StaticCollider &addTree(sf::Vector3f groundPosition, float scale);
  StaticCollider &addRock(sf::Vector3f position, float radius);
  StaticCollider &addBuilding(sf::Vector3f groundPosition, sf::Vector3f size);
  void addMountain(sf::Vector3f groundPosition, float width, float height);

  // 全部登记到碰撞系统；有碰撞体已登记在其他系统时返回 false
  bool registerWith(CollisionSystem &collision) const;

  // 找一个不与任何碰撞体重叠的出生点
  sf::Vector3f findSpawnPoint(const CollisionSystem &collision, float clearance);

  const std::vector<std::unique_ptr<StaticCollider>> &getColliders() const { return m_colliders; }
  std::size_t count(EntityKind kind) const;
  std::size_t size() const { return m_colliders.size(); }

  void clear() { m_colliders.clear(); }

private:
  float randomRange(float lo, float hi);

  ArenaConfig m_config;
  std::mt19937 m_rng;
  std::vector<std::unique_ptr<StaticCollider>> m_colliders;
};
