#pragma once

#include <SFML/System/Vector3.hpp>
#include <string>
#include "CollisionShape.hpp"

class CollisionSystem;

// 参与碰撞的实体种类（封闭集合）
enum class EntityKind
{
  Shell,    // 炮弹
  Tank,     // 坦克（玩家/NPC）
  Tree,     // 树
  Rock,     // 岩石
  Building, // 建筑
  Mountain, // 山体
  Unknown
};

const char *toString(EntityKind kind);

// 静态环境物体：彼此之间不做碰撞检测
bool isStaticKind(EntityKind kind);

// 可受伤害的能力
class Damageable
{
public:
  virtual ~Damageable() = default;

  // 返回 true 表示这次伤害将其击毁（已击毁的目标不再返回 true）
  virtual bool takeDamage(float amount) = 0;
  virtual float getHealth() const = 0;
  virtual bool isDestroyed() const = 0;
};

// 碰撞能力契约
class Collidable
{
public:
  Collidable() = default;
  virtual ~Collidable();

  Collidable(const Collidable &) = delete;
  Collidable &operator=(const Collidable &) = delete;

  virtual CollisionShape getShape() const = 0;
  virtual sf::Vector3f getPosition() const = 0;
  virtual EntityKind getKind() const = 0;

  // 碰撞确认后回调，默认不处理
  virtual void onCollision(Collidable &other) { (void)other; }

  // 失效的实体（如已命中的炮弹）不再参与检测
  virtual bool isActive() const { return true; }

  // 发射者，用于排除炮弹与自己坦克的碰撞
  virtual const Collidable *getOwner() const { return nullptr; }

  // 可受伤害时返回自身
  virtual Damageable *asDamageable() { return nullptr; }

  // 用于日志/事件的名字
  virtual std::string getName() const { return toString(getKind()); }

  bool isRegistered() const { return m_collisionSystem != nullptr; }

private:
  friend class CollisionSystem;

  // 注册所在的碰撞系统，析构时自动注销
  CollisionSystem *m_collisionSystem = nullptr;
};
