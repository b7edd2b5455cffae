#include "CombatEvents.hpp"

void CombatEvents::emitTargetHit(const TargetHitEvent &event)
{
  ++m_hitCount;

  if (m_onTargetHit)
    m_onTargetHit(event);

  for (auto &listener : m_hitListeners)
  {
    listener(event);
  }
}

void CombatEvents::emitTargetDestroyed(const TargetDestroyedEvent &event)
{
  ++m_destroyedCount;

  if (m_onTargetDestroyed)
    m_onTargetDestroyed(event);

  for (auto &listener : m_destroyedListeners)
  {
    listener(event);
  }
}

void CombatEvents::clear()
{
  m_onTargetHit = nullptr;
  m_onTargetDestroyed = nullptr;
  m_hitListeners.clear();
  m_destroyedListeners.clear();
  m_hitCount = 0;
  m_destroyedCount = 0;
}
