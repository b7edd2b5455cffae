#pragma once

#include <optional>
#include "Collidable.hpp"

// 静态环境碰撞体（树、岩石、建筑、山体），构造后不可变
class StaticCollider : public Collidable
{
public:
  // 优先使用半径（球），其次使用尺寸（盒），都没有时默认半径 1 的球
  StaticCollider(sf::Vector3f position, EntityKind kind,
                 std::optional<float> radius = std::nullopt,
                 std::optional<sf::Vector3f> size = std::nullopt);

  CollisionShape getShape() const override { return m_shape; }
  sf::Vector3f getPosition() const override { return m_position; }
  EntityKind getKind() const override { return m_kind; }

private:
  const sf::Vector3f m_position;
  const EntityKind m_kind;
  const CollisionShape m_shape;
};
