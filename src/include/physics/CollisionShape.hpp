#pragma once

#include <SFML/System/Vector3.hpp>
#include <variant>

// 球形碰撞体
struct SphereShape
{
  sf::Vector3f center;
  float radius = 1.f;
};

// 轴对齐包围盒（中心 + 半边长）
struct BoxShape
{
  sf::Vector3f center;
  sf::Vector3f halfExtents;

  sf::Vector3f min() const { return center - halfExtents; }
  sf::Vector3f max() const { return center + halfExtents; }
};

// std::monostate 表示无效形状，永远不会判定为碰撞
using CollisionShape = std::variant<std::monostate, SphereShape, BoxShape>;

namespace Shapes
{
  CollisionShape sphere(sf::Vector3f center, float radius);

  // size 为完整尺寸，内部转为半边长
  CollisionShape boxFromCenterAndSize(sf::Vector3f center, sf::Vector3f size);

  // 两个形状是否相交
  // 球-球：圆心距 < 半径和（相切不算）
  // 盒-盒、球-盒：轴对齐相交，无容差
  bool intersects(const CollisionShape &a, const CollisionShape &b);

  bool intersects(const SphereShape &a, const SphereShape &b);
  bool intersects(const BoxShape &a, const BoxShape &b);
  bool intersects(const SphereShape &sphere, const BoxShape &box);

  // 点是否在形状内（球：距离 < 半径；盒：含边界）
  bool containsPoint(const CollisionShape &shape, sf::Vector3f point);

  bool isValid(const CollisionShape &shape);
}
