#include "HealthBar.hpp"
#include <algorithm>

HealthBar::HealthBar(float maxHealth)
    : m_maxHealth(maxHealth), m_health(maxHealth)
{
  updateBar();
}

void HealthBar::setMaxHealth(float maxHealth)
{
  m_maxHealth = maxHealth;
  m_health = std::min(m_health, m_maxHealth);
  updateBar();
}

void HealthBar::setHealth(float health)
{
  m_health = std::max(0.f, std::min(health, m_maxHealth));
  updateBar();
}

void HealthBar::updateBar()
{
  float ratio = getRatio();

  // 根据血量改变颜色
  if (ratio > 0.6f)
  {
    m_color = sf::Color::Green;
  }
  else if (ratio > 0.3f)
  {
    m_color = sf::Color::Yellow;
  }
  else
  {
    m_color = sf::Color::Red;
  }
}
