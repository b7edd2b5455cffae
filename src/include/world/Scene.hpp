#pragma once

#include <SFML/System/Vector3.hpp>
#include <cstdint>
#include <unordered_map>

// 可视资源种类
enum class VisualKind
{
  Mesh,      // 实体模型（炮弹、坦克）
  Trail,     // 尾迹点云
  Particles  // 爆炸粒子
};

struct Visual
{
  VisualKind kind = VisualKind::Mesh;
  sf::Vector3f position;
  float scale = 1.f;
  float opacity = 1.f;
};

class Scene;

// 可视资源句柄：析构或 release() 时从场景移除，只能移动
class VisualHandle
{
public:
  VisualHandle() = default;
  VisualHandle(Scene *scene, std::uint32_t id) : m_scene(scene), m_id(id) {}
  ~VisualHandle() { release(); }

  VisualHandle(const VisualHandle &) = delete;
  VisualHandle &operator=(const VisualHandle &) = delete;
  VisualHandle(VisualHandle &&other) noexcept;
  VisualHandle &operator=(VisualHandle &&other) noexcept;

  // 从场景移除（重复调用无副作用）
  void release();

  bool isValid() const { return m_scene != nullptr; }
  std::uint32_t getId() const { return m_id; }

  // 句柄有效时更新场景中的对象
  void setPosition(sf::Vector3f position);
  void setScale(float scale);
  void setOpacity(float opacity);

private:
  Scene *m_scene = nullptr;
  std::uint32_t m_id = 0;
};

// 无头场景：只记录当前存在的可视对象，渲染不在此处
class Scene
{
public:
  VisualHandle add(VisualKind kind, sf::Vector3f position);
  void remove(std::uint32_t id);

  bool contains(std::uint32_t id) const { return m_visuals.count(id) > 0; }
  const Visual *find(std::uint32_t id) const;
  Visual *find(std::uint32_t id);

  std::size_t size() const { return m_visuals.size(); }
  std::size_t count(VisualKind kind) const;

private:
  std::unordered_map<std::uint32_t, Visual> m_visuals;
  std::uint32_t m_nextId = 1;
};
