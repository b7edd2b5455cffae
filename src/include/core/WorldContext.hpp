#pragma once

class Scene;
class EffectScheduler;
class CombatEvents;
class CollisionSystem;

// 注入到实体的世界上下文（非拥有指针，生命周期长于实体）
struct WorldContext
{
  Scene *scene = nullptr;               // 可视资源
  EffectScheduler *effects = nullptr;   // 每帧特效任务
  CombatEvents *events = nullptr;       // 命中/击毁通知，可为空
  CollisionSystem *collision = nullptr; // 碰撞登记
};
