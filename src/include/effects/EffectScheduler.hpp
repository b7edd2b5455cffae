#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <vector>

// 每帧执行一次的任务
class FrameTask
{
public:
  virtual ~FrameTask() = default;

  // 返回 false 表示任务结束，将从列表移除
  virtual bool update() = 0;
};

using TaskId = std::uint32_t;

// 每帧任务列表（爆炸等纯视觉效果），取消即从列表移除
class EffectScheduler
{
public:
  explicit EffectScheduler(unsigned int seed = std::random_device{}());

  TaskId add(std::unique_ptr<FrameTask> task);

  // 取消任务；返回是否存在该任务
  bool cancel(TaskId id);

  // 推进一帧
  void update();

  // 清空所有任务；更新过程中调用时与 cancel 一样只做标记
  void clear();

  std::size_t size() const;
  bool contains(TaskId id) const;

  // 视觉效果共用的随机数
  std::mt19937 &getRng() { return m_rng; }

private:
  struct Entry
  {
    TaskId id;
    std::unique_ptr<FrameTask> task;
    bool finished = false;
  };

  void removeFinished();

  std::vector<Entry> m_tasks;
  TaskId m_nextId = 1;
  bool m_updating = false;
  std::mt19937 m_rng;
};
