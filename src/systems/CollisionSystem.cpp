#include "CollisionSystem.hpp"
#include <algorithm>
#include <iostream>

CollisionSystem::~CollisionSystem()
{
  // 系统先于实体销毁时，断开实体的反向引用
  for (Collidable *collider : m_colliders)
  {
    if (collider->m_collisionSystem == this)
      collider->m_collisionSystem = nullptr;
  }
}

bool CollisionSystem::addCollider(Collidable &collider)
{
  // 实体只保存一个反向引用，同时登记到两个系统会在析构时留下悬空指针
  if (collider.m_collisionSystem && collider.m_collisionSystem != this)
  {
    std::cerr << "[Collision] " << collider.getName()
              << " is already registered with another collision system" << std::endl;
    return false;
  }

  m_colliders.push_back(&collider);
  collider.m_collisionSystem = this;
  return true;
}

void CollisionSystem::removeCollider(Collidable &collider)
{
  auto it = std::find(m_colliders.begin(), m_colliders.end(), &collider);
  if (it == m_colliders.end())
    return;

  m_colliders.erase(it);
  markRemoved(&collider);

  // 重复登记时仍保留反向引用
  if (!contains(collider) && collider.m_collisionSystem == this)
    collider.m_collisionSystem = nullptr;
}

void CollisionSystem::detach(Collidable &collider)
{
  m_colliders.erase(
      std::remove(m_colliders.begin(), m_colliders.end(), &collider),
      m_colliders.end());
  markRemoved(&collider);
  collider.m_collisionSystem = nullptr;
}

bool CollisionSystem::contains(const Collidable &collider) const
{
  return std::find(m_colliders.begin(), m_colliders.end(), &collider) != m_colliders.end();
}

void CollisionSystem::markRemoved(const Collidable *collider)
{
  if (m_sweeping)
    m_removedDuringSweep.push_back(collider);
}

bool CollisionSystem::isRemovedDuringSweep(const Collidable *collider) const
{
  return std::find(m_removedDuringSweep.begin(), m_removedDuringSweep.end(), collider) !=
         m_removedDuringSweep.end();
}

bool CollisionSystem::shouldSkipCollision(const Collidable &a, const Collidable &b)
{
  // 静态环境物体（树、岩石、建筑、山体）之间不检测
  if (isStaticKind(a.getKind()) && isStaticKind(b.getKind()))
    return true;

  // 炮弹不和自己的发射者碰撞
  if (a.getOwner() == &b || b.getOwner() == &a)
    return true;

  return false;
}

bool CollisionSystem::testCollision(const Collidable &a, const Collidable &b)
{
  return Shapes::intersects(a.getShape(), b.getShape());
}

void CollisionSystem::checkCollisions()
{
  // 快照：回调中增删实体不影响本轮遍历
  std::vector<Collidable *> snapshot;
  snapshot.reserve(m_colliders.size());
  for (Collidable *collider : m_colliders)
  {
    // 已失效的炮弹直接剔除
    if (collider->isActive())
      snapshot.push_back(collider);
  }

  m_sweeping = true;
  m_removedDuringSweep.clear();
  m_lastContactCount = 0;

  for (std::size_t i = 0; i < snapshot.size(); ++i)
  {
    Collidable *a = snapshot[i];

    for (std::size_t j = i + 1; j < snapshot.size(); ++j)
    {
      // a 可能在本行前面的碰撞中被注销或失效
      if (isRemovedDuringSweep(a) || !a->isActive())
        break;

      Collidable *b = snapshot[j];
      if (isRemovedDuringSweep(b) || !b->isActive())
        continue;

      if (shouldSkipCollision(*a, *b))
        continue;

      if (testCollision(*a, *b))
      {
        ++m_lastContactCount;
        dispatchCollision(*a, *b);
      }
    }
  }

  m_sweeping = false;
  m_removedDuringSweep.clear();
}

void CollisionSystem::dispatchCollision(Collidable &a, Collidable &b)
{
  bool aIsShell = a.getKind() == EntityKind::Shell;
  bool bIsShell = b.getKind() == EntityKind::Shell;

  auto bothPresent = [&]()
  {
    return !isRemovedDuringSweep(&a) && !isRemovedDuringSweep(&b);
  };

  // 炮弹先处理：它的失效标志决定另一方看到的是否还是活的炮弹
  if (aIsShell)
    a.onCollision(b);
  if (bIsShell && bothPresent())
    b.onCollision(a);

  if (!aIsShell && bothPresent())
    a.onCollision(b);
  if (!bIsShell && bothPresent())
    b.onCollision(a);
}

Collidable *CollisionSystem::checkPointCollision(sf::Vector3f point, const Collidable *exclude) const
{
  for (Collidable *collider : m_colliders)
  {
    if (collider == exclude)
      continue;

    if (Shapes::containsPoint(collider->getShape(), point))
      return collider;
  }

  return nullptr;
}
