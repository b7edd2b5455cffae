#pragma once

#include <cstddef>

// 炮弹参数（每 tick 为单位，60 tick/秒）
struct ShellConfig
{
  float gravity = 0.01f;        // 每 tick 竖直速度衰减
  int maxLifetime = 600;        // 最大存活 tick 数（60fps 下 10 秒）
  float collisionRadius = 0.2f; // 碰撞球半径
  float trailFadeRate = 0.96f;  // 尾迹逐段衰减
  float damage = 25.f;          // 命中坦克伤害（满血 4 发击毁）
  bool verbose = false;         // 命中/落地日志
};

// 尾迹槽位数（固定长度环）
constexpr std::size_t SHELL_TRAIL_LENGTH = 40;

// 爆炸特效参数
struct ExplosionConfig
{
  int particleCount = 30;
  int maxFrames = 20;
  float particleSize = 0.2f;
  float expirySizeScale = 0.5f; // 超时自爆用的小爆炸
};

// 坦克参数
struct TankConfig
{
  float collisionRadius = 2.0f;
  float maxHealth = 100.f;
  int reloadTicks = 60;       // 1 秒冷却
  float shellSpeed = 6.0f;    // 每 tick 位移
  float barrelOffset = 1.5f;  // 炮塔枢轴到炮口的距离
  float turretHeight = 1.0f;  // 炮塔枢轴离车身原点高度
  float moveSpeed = 0.15f;
  float turretRotationSpeed = 0.04f;
  float barrelElevationSpeed = 0.03f;
  float minBarrelElevation = -0.785398f; // -PI/4，炮管最高抬起
  float maxBarrelElevation = 0.f;        // 炮管水平
};

// NPC 坦克参数
struct NpcConfig
{
  int reloadTicks = 180;        // 3 秒冷却，比玩家慢
  float shellSpeed = 4.8f;
  float targetingDistance = 300.f;
  float fireProbability = 0.01f; // 装填完成后每 tick 开火概率
};

// 场地布局
struct ArenaConfig
{
  unsigned int seed = 1;
  float halfSize = 250.f; // 场地半边长
  int treeCount = 60;
  int rockCount = 40;
  int buildingCount = 8;
  int mountainCount = 2;
  bool verbose = true;       // 生成后输出统计
};

// 主循环
struct GameConfig
{
  int tickRate = 60;
  int maxTicks = 3600;       // 无头模拟默认跑 1 分钟
  bool realTime = false;     // true 时按 tickRate 限速
  int playerRespawnTicks = 300;
  int npcRespawnTicks = 120;
  int npcCount = 4;
  bool verbose = true;

  ArenaConfig arena;
  TankConfig tank;
  NpcConfig npc;
  ShellConfig shell;
  ExplosionConfig explosion;
};
