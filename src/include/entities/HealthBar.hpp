#pragma once

#include <SFML/Graphics/Color.hpp>

// 坦克血量及血条颜色
class HealthBar
{
public:
  explicit HealthBar(float maxHealth = 100.f);

  void setMaxHealth(float maxHealth);
  void setHealth(float health);

  float getHealth() const { return m_health; }
  float getMaxHealth() const { return m_maxHealth; }
  float getRatio() const { return m_maxHealth > 0.f ? m_health / m_maxHealth : 0.f; }
  bool isDead() const { return m_health <= 0; }

  // 血条颜色：绿 > 60%，黄 > 30%，否则红
  sf::Color getColor() const { return m_color; }

private:
  void updateBar();

  float m_maxHealth = 100.f;
  float m_health = 100.f;
  sf::Color m_color = sf::Color::Green;
};
