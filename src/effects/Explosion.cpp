#include "Explosion.hpp"
#include <cstdint>
#include <memory>

Explosion::Explosion(Scene &scene, sf::Vector3f position, float sizeScale,
                     const ExplosionConfig &config, std::mt19937 &rng)
    : m_visual(scene.add(VisualKind::Particles, position)),
      m_position(position),
      m_sizeScale(sizeScale),
      m_particleSize(config.particleSize * sizeScale),
      m_maxFrames(config.maxFrames)
{
  std::uniform_real_distribution<float> unit(0.f, 1.f);

  m_particles.reserve(static_cast<std::size_t>(config.particleCount));
  for (int i = 0; i < config.particleCount; ++i)
  {
    ExplosionParticle particle;
    // 球内随机位置，偏向上方
    particle.offset = {(unit(rng) - 0.5f) * 2.f,
                       unit(rng) * 2.f,
                       (unit(rng) - 0.5f) * 2.f};

    // 黄-橙-红渐变，无蓝色
    float red = unit(rng) * 0.5f + 0.5f;
    float green = unit(rng) * 0.5f;
    particle.color = sf::Color(static_cast<std::uint8_t>(red * 255.f),
                               static_cast<std::uint8_t>(green * 255.f),
                               0);
    m_particles.push_back(particle);
  }

  // 创建当帧即显示第 0 帧
  applyFrame();
}

bool Explosion::update()
{
  if (m_frame >= m_maxFrames)
  {
    m_visual.release();
    return false;
  }

  applyFrame();
  return true;
}

void Explosion::applyFrame()
{
  // 向外扩散
  m_scale = m_sizeScale * (1.f + static_cast<float>(m_frame) * 0.1f);
  // 线性淡出
  m_opacity = 1.f - static_cast<float>(m_frame) / static_cast<float>(m_maxFrames);

  m_visual.setScale(m_scale);
  m_visual.setOpacity(m_opacity);
  ++m_frame;
}

TaskId spawnExplosion(EffectScheduler &effects, Scene &scene, sf::Vector3f position,
                      float sizeScale, const ExplosionConfig &config)
{
  return effects.add(std::make_unique<Explosion>(scene, position, sizeScale, config, effects.getRng()));
}
