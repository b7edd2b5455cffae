#pragma once

#include <functional>
#include <utility>
#include <vector>

class Collidable;

// 目标被击中
struct TargetHitEvent
{
  Collidable *target = nullptr;
  const Collidable *source = nullptr; // 开炮的坦克
  float damageAmount = 0.f;
};

// 目标被击毁
struct TargetDestroyedEvent
{
  Collidable *target = nullptr;
  const Collidable *source = nullptr;
};

using OnTargetHitCallback = std::function<void(const TargetHitEvent &event)>;
using OnTargetDestroyedCallback = std::function<void(const TargetDestroyedEvent &event)>;

// 战斗通知通道：命中与击毁事件在发生的同一 tick 内同步派发
class CombatEvents
{
public:
  // 设置回调（覆盖之前的回调）
  void setOnTargetHit(OnTargetHitCallback cb) { m_onTargetHit = std::move(cb); }
  void setOnTargetDestroyed(OnTargetDestroyedCallback cb) { m_onTargetDestroyed = std::move(cb); }

  // 追加监听者（回调之后依次调用）
  void addTargetHitListener(OnTargetHitCallback cb) { m_hitListeners.push_back(std::move(cb)); }
  void addTargetDestroyedListener(OnTargetDestroyedCallback cb) { m_destroyedListeners.push_back(std::move(cb)); }

  void emitTargetHit(const TargetHitEvent &event);
  void emitTargetDestroyed(const TargetDestroyedEvent &event);

  // 累计派发次数
  int getHitCount() const { return m_hitCount; }
  int getDestroyedCount() const { return m_destroyedCount; }

  void clear();

private:
  OnTargetHitCallback m_onTargetHit;
  OnTargetDestroyedCallback m_onTargetDestroyed;
  std::vector<OnTargetHitCallback> m_hitListeners;
  std::vector<OnTargetDestroyedCallback> m_destroyedListeners;

  int m_hitCount = 0;
  int m_destroyedCount = 0;
};
