#pragma once

#include <SFML/System/Vector3.hpp>
#include <vector>
#include "Collidable.hpp"

// 碰撞系统：登记参与碰撞的实体，每 tick 做一次两两检测并分发回调
// 只持有非拥有指针；实体析构时会自动注销
class CollisionSystem
{
public:
  CollisionSystem() = default;
  ~CollisionSystem();

  CollisionSystem(const CollisionSystem &) = delete;
  CollisionSystem &operator=(const CollisionSystem &) = delete;

  // 登记（同一系统内不查重，重复登记由调用方负责）
  // 实体已登记在其他系统时拒绝并返回 false
  bool addCollider(Collidable &collider);

  // 按身份注销，不存在时忽略
  void removeCollider(Collidable &collider);

  const std::vector<Collidable *> &getColliders() const { return m_colliders; }
  std::size_t size() const { return m_colliders.size(); }
  bool contains(const Collidable &collider) const;

  // 每 tick 的碰撞检测
  void checkCollisions();

  // 返回第一个包含该点的实体（排除 exclude），没有则返回 nullptr
  Collidable *checkPointCollision(sf::Vector3f point, const Collidable *exclude = nullptr) const;

  // 静态物体之间、炮弹与其发射者之间跳过检测
  static bool shouldSkipCollision(const Collidable &a, const Collidable &b);

  // 形状相交测试
  static bool testCollision(const Collidable &a, const Collidable &b);

  // 本次检测中已经分发的碰撞对数量（调试统计）
  std::size_t getLastContactCount() const { return m_lastContactCount; }

private:
  friend class Collidable;

  // 移除该实体的所有登记（实体析构时调用）
  void detach(Collidable &collider);

  // 炮弹一方优先处理，再处理其余一方
  void dispatchCollision(Collidable &a, Collidable &b);

  void markRemoved(const Collidable *collider);
  bool isRemovedDuringSweep(const Collidable *collider) const;

  std::vector<Collidable *> m_colliders;

  // 检测进行中被注销/析构的实体，本轮剩余部分跳过
  bool m_sweeping = false;
  std::vector<const Collidable *> m_removedDuringSweep;

  std::size_t m_lastContactCount = 0;
};
