#pragma once

#include <SFML/Graphics/Color.hpp>
#include <SFML/System/Vector3.hpp>
#include <random>
#include <vector>
#include "Config.hpp"
#include "EffectScheduler.hpp"
#include "Scene.hpp"

struct ExplosionParticle
{
  sf::Vector3f offset; // 相对爆炸中心
  sf::Color color;
};

// 爆炸粒子特效：向外扩散并线性淡出，固定帧数后结束
class Explosion : public FrameTask
{
public:
  Explosion(Scene &scene, sf::Vector3f position, float sizeScale,
            const ExplosionConfig &config, std::mt19937 &rng);

  bool update() override;

  sf::Vector3f getPosition() const { return m_position; }
  int getFrame() const { return m_frame; }
  float getScale() const { return m_scale; }
  float getOpacity() const { return m_opacity; }
  float getParticleSize() const { return m_particleSize; }
  const std::vector<ExplosionParticle> &getParticles() const { return m_particles; }
  bool isVisible() const { return m_visual.isValid(); }

private:
  void applyFrame();

  VisualHandle m_visual;
  sf::Vector3f m_position;
  std::vector<ExplosionParticle> m_particles;
  float m_sizeScale;
  float m_particleSize;
  int m_maxFrames;
  int m_frame = 0;
  float m_scale = 1.f;
  float m_opacity = 1.f;
};

// 生成一个爆炸并交给任务列表
TaskId spawnExplosion(EffectScheduler &effects, Scene &scene, sf::Vector3f position,
                      float sizeScale, const ExplosionConfig &config);
