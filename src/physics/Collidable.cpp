#include "Collidable.hpp"
#include "CollisionSystem.hpp"

Collidable::~Collidable()
{
  if (m_collisionSystem)
  {
    m_collisionSystem->detach(*this);
  }
}

const char *toString(EntityKind kind)
{
  switch (kind)
  {
  case EntityKind::Shell:
    return "shell";
  case EntityKind::Tank:
    return "tank";
  case EntityKind::Tree:
    return "tree";
  case EntityKind::Rock:
    return "rock";
  case EntityKind::Building:
    return "building";
  case EntityKind::Mountain:
    return "mountain";
  default:
    return "unknown";
  }
}

bool isStaticKind(EntityKind kind)
{
  switch (kind)
  {
  case EntityKind::Tree:
  case EntityKind::Rock:
  case EntityKind::Building:
  case EntityKind::Mountain:
    return true;
  default:
    return false;
  }
}
