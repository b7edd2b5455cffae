#include "StaticCollider.hpp"

namespace
{
  CollisionShape makeShape(sf::Vector3f position, std::optional<float> radius, std::optional<sf::Vector3f> size)
  {
    if (radius)
      return Shapes::sphere(position, *radius);
    if (size)
      return Shapes::boxFromCenterAndSize(position, *size);
    return Shapes::sphere(position, 1.f);
  }
}

StaticCollider::StaticCollider(sf::Vector3f position, EntityKind kind,
                               std::optional<float> radius,
                               std::optional<sf::Vector3f> size)
    : m_position(position), m_kind(kind), m_shape(makeShape(position, radius, size))
{
}
