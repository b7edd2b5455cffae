#include "Scene.hpp"
#include <algorithm>

VisualHandle::VisualHandle(VisualHandle &&other) noexcept
    : m_scene(other.m_scene), m_id(other.m_id)
{
  other.m_scene = nullptr;
  other.m_id = 0;
}

VisualHandle &VisualHandle::operator=(VisualHandle &&other) noexcept
{
  if (this != &other)
  {
    release();
    m_scene = other.m_scene;
    m_id = other.m_id;
    other.m_scene = nullptr;
    other.m_id = 0;
  }
  return *this;
}

void VisualHandle::release()
{
  if (m_scene)
  {
    m_scene->remove(m_id);
    m_scene = nullptr;
  }
}

void VisualHandle::setPosition(sf::Vector3f position)
{
  if (!m_scene)
    return;
  if (Visual *visual = m_scene->find(m_id))
    visual->position = position;
}

void VisualHandle::setScale(float scale)
{
  if (!m_scene)
    return;
  if (Visual *visual = m_scene->find(m_id))
    visual->scale = scale;
}

void VisualHandle::setOpacity(float opacity)
{
  if (!m_scene)
    return;
  if (Visual *visual = m_scene->find(m_id))
    visual->opacity = opacity;
}

VisualHandle Scene::add(VisualKind kind, sf::Vector3f position)
{
  std::uint32_t id = m_nextId++;
  Visual visual;
  visual.kind = kind;
  visual.position = position;
  m_visuals[id] = visual;
  return VisualHandle(this, id);
}

void Scene::remove(std::uint32_t id)
{
  m_visuals.erase(id);
}

const Visual *Scene::find(std::uint32_t id) const
{
  auto it = m_visuals.find(id);
  return it != m_visuals.end() ? &it->second : nullptr;
}

Visual *Scene::find(std::uint32_t id)
{
  auto it = m_visuals.find(id);
  return it != m_visuals.end() ? &it->second : nullptr;
}

std::size_t Scene::count(VisualKind kind) const
{
  return static_cast<std::size_t>(std::count_if(m_visuals.begin(), m_visuals.end(),
                                                [kind](const auto &entry)
                                                { return entry.second.kind == kind; }));
}
