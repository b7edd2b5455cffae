#include "Arena.hpp"
#include "CollisionSystem.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <iterator>

Arena::Arena(const ArenaConfig &config)
    : m_config(config), m_rng(config.seed)
{
}

float Arena::randomRange(float lo, float hi)
{
  std::uniform_real_distribution<float> dist(lo, hi);
  return dist(m_rng);
}

void Arena::generate()
{
  m_colliders.clear();
  m_rng.seed(m_config.seed);

  const float extent = m_config.halfSize;

  // 山体放在外围，避开中心出生区
  for (int i = 0; i < m_config.mountainCount; ++i)
  {
    float angle = randomRange(0.f, 2.f * Utils::PI);
    float dist = randomRange(extent * 0.6f, extent * 0.85f);
    float height = 160.f + std::sin(static_cast<float>(i) + 1.f) * 40.f;
    float width = 100.f + std::sin((static_cast<float>(i) + 1.f) * 1.3f) * 30.f;
    addMountain({std::cos(angle) * dist, 0.f, std::sin(angle) * dist}, width, height);
  }

  for (int i = 0; i < m_config.buildingCount; ++i)
  {
    sf::Vector3f ground{randomRange(-extent, extent), 0.f, randomRange(-extent, extent)};
    sf::Vector3f size{randomRange(8.f, 16.f), randomRange(6.f, 20.f), randomRange(8.f, 16.f)};
    addBuilding(ground, size);
  }

  for (int i = 0; i < m_config.rockCount; ++i)
  {
    float radius = randomRange(1.f, 3.f);
    addRock({randomRange(-extent, extent), radius * 0.5f, randomRange(-extent, extent)}, radius);
  }

  for (int i = 0; i < m_config.treeCount; ++i)
  {
    addTree({randomRange(-extent, extent), 0.f, randomRange(-extent, extent)}, randomRange(0.8f, 1.5f));
  }

  if (!m_config.verbose)
    return;

  std::cout << "[Arena] Generated " << count(EntityKind::Tree) << " trees, "
            << count(EntityKind::Rock) << " rocks, "
            << count(EntityKind::Building) << " buildings, "
            << count(EntityKind::Mountain) << " mountain colliders (seed " << m_config.seed << ")" << std::endl;
}

StaticCollider &Arena::addTree(sf::Vector3f groundPosition, float scale)
{
  // 碰撞球按树的缩放，球心离地一个半径
  float radius = 1.f * scale;
  sf::Vector3f center{groundPosition.x, groundPosition.y + radius, groundPosition.z};
  m_colliders.push_back(std::make_unique<StaticCollider>(center, EntityKind::Tree, radius));
  return *m_colliders.back();
}

StaticCollider &Arena::addRock(sf::Vector3f position, float radius)
{
  m_colliders.push_back(std::make_unique<StaticCollider>(position, EntityKind::Rock, radius));
  return *m_colliders.back();
}

StaticCollider &Arena::addBuilding(sf::Vector3f groundPosition, sf::Vector3f size)
{
  // 建筑用盒子，中心在半高处
  sf::Vector3f center{groundPosition.x, groundPosition.y + size.y / 2.f, groundPosition.z};
  m_colliders.push_back(std::make_unique<StaticCollider>(center, EntityKind::Building, std::nullopt, size));
  return *m_colliders.back();
}

void Arena::addMountain(sf::Vector3f groundPosition, float width, float height)
{
  // 山芯
  sf::Vector3f core{groundPosition.x, groundPosition.y + height * 0.5f, groundPosition.z};
  m_colliders.push_back(std::make_unique<StaticCollider>(core, EntityKind::Mountain, width * 0.6f));

  // 山脚一圈
  const int baseCount = 6;
  for (int i = 0; i < baseCount; ++i)
  {
    float angle = static_cast<float>(i) / baseCount * 2.f * Utils::PI;
    float distance = width * 0.4f;
    sf::Vector3f base{groundPosition.x + std::cos(angle) * distance,
                      groundPosition.y + height * 0.3f,
                      groundPosition.z + std::sin(angle) * distance};
    m_colliders.push_back(std::make_unique<StaticCollider>(base, EntityKind::Mountain, width * 0.25f));
  }
}

bool Arena::registerWith(CollisionSystem &collision) const
{
  bool ok = true;
  for (const auto &collider : m_colliders)
  {
    if (!collision.addCollider(*collider))
      ok = false;
  }
  return ok;
}

sf::Vector3f Arena::findSpawnPoint(const CollisionSystem &collision, float clearance)
{
  const float extent = m_config.halfSize * 0.5f;
  const int maxAttempts = 200;

  for (int attempt = 0; attempt < maxAttempts; ++attempt)
  {
    sf::Vector3f candidate{randomRange(-extent, extent), 0.f, randomRange(-extent, extent)};

    // 中心和四周探测点都空闲才可用
    const sf::Vector3f probes[] = {
        candidate + sf::Vector3f{0.f, clearance * 0.5f, 0.f},
        candidate + sf::Vector3f{clearance, clearance * 0.5f, 0.f},
        candidate + sf::Vector3f{-clearance, clearance * 0.5f, 0.f},
        candidate + sf::Vector3f{0.f, clearance * 0.5f, clearance},
        candidate + sf::Vector3f{0.f, clearance * 0.5f, -clearance}};

    bool blocked = std::any_of(std::begin(probes), std::end(probes),
                               [&collision](sf::Vector3f p)
                               { return collision.checkPointCollision(p) != nullptr; });
    if (!blocked)
      return candidate;
  }

  std::cerr << "[Arena] No clear spawn point found, using origin" << std::endl;
  return {0.f, 0.f, 0.f};
}

std::size_t Arena::count(EntityKind kind) const
{
  return static_cast<std::size_t>(std::count_if(m_colliders.begin(), m_colliders.end(),
                                                [kind](const std::unique_ptr<StaticCollider> &c)
                                                { return c->getKind() == kind; }));
}
