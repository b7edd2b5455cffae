#pragma once

#include <SFML/System/Vector3.hpp>
#include <cmath>

namespace Utils
{
  constexpr float PI = 3.14159265f;

  // 两点距离的平方
  inline float distanceSquared(sf::Vector3f a, sf::Vector3f b)
  {
    sf::Vector3f d = a - b;
    return d.x * d.x + d.y * d.y + d.z * d.z;
  }

  inline float distance(sf::Vector3f a, sf::Vector3f b)
  {
    return std::sqrt(distanceSquared(a, b));
  }

  inline float length(sf::Vector3f v)
  {
    return std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z);
  }

  // 归一化（零向量原样返回）
  inline sf::Vector3f normalize(sf::Vector3f v)
  {
    float len = length(v);
    if (len == 0.f)
      return v;
    return v / len;
  }

  // 把角度规范到 [-PI, PI]
  inline float wrapAngle(float radians)
  {
    while (radians > PI)
      radians -= 2.f * PI;
    while (radians < -PI)
      radians += 2.f * PI;
    return radians;
  }

  // 朝目标角度按最大步长逼近
  inline float approach(float current, float target, float maxStep)
  {
    float diff = target - current;
    if (std::abs(diff) <= maxStep)
      return target;
    return current + (diff > 0.f ? maxStep : -maxStep);
  }

  // 绕 X 轴旋转（炮管俯仰）
  inline sf::Vector3f rotateX(sf::Vector3f v, float angle)
  {
    float c = std::cos(angle);
    float s = std::sin(angle);
    return {v.x, v.y * c - v.z * s, v.y * s + v.z * c};
  }

  // 绕 Y 轴旋转（车身/炮塔偏航）
  inline sf::Vector3f rotateY(sf::Vector3f v, float angle)
  {
    float c = std::cos(angle);
    float s = std::sin(angle);
    return {v.x * c + v.z * s, v.y, -v.x * s + v.z * c};
  }
}
