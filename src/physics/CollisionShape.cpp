#include "CollisionShape.hpp"
#include "Utils.hpp"
#include <algorithm>

namespace Shapes
{
  CollisionShape sphere(sf::Vector3f center, float radius)
  {
    return SphereShape{center, radius};
  }

  CollisionShape boxFromCenterAndSize(sf::Vector3f center, sf::Vector3f size)
  {
    return BoxShape{center, size / 2.f};
  }

  bool intersects(const SphereShape &a, const SphereShape &b)
  {
    float sumRadii = a.radius + b.radius;
    return Utils::distance(a.center, b.center) < sumRadii;
  }

  bool intersects(const BoxShape &a, const BoxShape &b)
  {
    sf::Vector3f aMin = a.min(), aMax = a.max();
    sf::Vector3f bMin = b.min(), bMax = b.max();

    // 任一轴分离即不相交
    if (bMax.x < aMin.x || bMin.x > aMax.x)
      return false;
    if (bMax.y < aMin.y || bMin.y > aMax.y)
      return false;
    if (bMax.z < aMin.z || bMin.z > aMax.z)
      return false;
    return true;
  }

  bool intersects(const SphereShape &sphere, const BoxShape &box)
  {
    // 盒内离球心最近的点
    sf::Vector3f boxMin = box.min(), boxMax = box.max();
    sf::Vector3f closest{
        std::clamp(sphere.center.x, boxMin.x, boxMax.x),
        std::clamp(sphere.center.y, boxMin.y, boxMax.y),
        std::clamp(sphere.center.z, boxMin.z, boxMax.z)};

    return Utils::distanceSquared(closest, sphere.center) <= sphere.radius * sphere.radius;
  }

  namespace
  {
    struct IntersectVisitor
    {
      bool operator()(const SphereShape &a, const SphereShape &b) const { return intersects(a, b); }
      bool operator()(const BoxShape &a, const BoxShape &b) const { return intersects(a, b); }
      bool operator()(const SphereShape &a, const BoxShape &b) const { return intersects(a, b); }
      bool operator()(const BoxShape &a, const SphereShape &b) const { return intersects(b, a); }

      // 无效形状的组合一律不碰撞
      template <typename A, typename B>
      bool operator()(const A &, const B &) const { return false; }
    };

    struct ContainsVisitor
    {
      sf::Vector3f point;

      bool operator()(const SphereShape &s) const
      {
        return Utils::distance(point, s.center) < s.radius;
      }

      bool operator()(const BoxShape &b) const
      {
        sf::Vector3f lo = b.min(), hi = b.max();
        return point.x >= lo.x && point.x <= hi.x &&
               point.y >= lo.y && point.y <= hi.y &&
               point.z >= lo.z && point.z <= hi.z;
      }

      bool operator()(std::monostate) const { return false; }
    };
  }

  bool intersects(const CollisionShape &a, const CollisionShape &b)
  {
    return std::visit(IntersectVisitor{}, a, b);
  }

  bool containsPoint(const CollisionShape &shape, sf::Vector3f point)
  {
    return std::visit(ContainsVisitor{point}, shape);
  }

  bool isValid(const CollisionShape &shape)
  {
    return !std::holds_alternative<std::monostate>(shape);
  }
}
