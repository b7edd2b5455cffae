#include "EffectScheduler.hpp"
#include <algorithm>

EffectScheduler::EffectScheduler(unsigned int seed)
    : m_rng(seed)
{
}

TaskId EffectScheduler::add(std::unique_ptr<FrameTask> task)
{
  if (!task)
    return 0;

  TaskId id = m_nextId++;
  m_tasks.push_back({id, std::move(task), false});
  return id;
}

bool EffectScheduler::cancel(TaskId id)
{
  auto it = std::find_if(m_tasks.begin(), m_tasks.end(),
                         [id](const Entry &e)
                         { return e.id == id && !e.finished; });
  if (it == m_tasks.end())
    return false;

  it->finished = true;

  // 更新过程中只做标记，帧末统一移除
  if (!m_updating)
    removeFinished();
  return true;
}

void EffectScheduler::update()
{
  m_updating = true;

  // 本帧新加入的任务下一帧才开始执行
  std::size_t count = m_tasks.size();
  for (std::size_t i = 0; i < count; ++i)
  {
    if (m_tasks[i].finished)
      continue;

    FrameTask *task = m_tasks[i].task.get();
    if (!task->update())
      m_tasks[i].finished = true;
  }

  m_updating = false;
  removeFinished();
}

void EffectScheduler::clear()
{
  // 更新过程中不能直接清空，任务对象可能仍在执行
  if (m_updating)
  {
    for (auto &entry : m_tasks)
      entry.finished = true;
    return;
  }

  m_tasks.clear();
}

std::size_t EffectScheduler::size() const
{
  return static_cast<std::size_t>(std::count_if(m_tasks.begin(), m_tasks.end(),
                                                [](const Entry &e)
                                                { return !e.finished; }));
}

bool EffectScheduler::contains(TaskId id) const
{
  return std::any_of(m_tasks.begin(), m_tasks.end(),
                     [id](const Entry &e)
                     { return e.id == id && !e.finished; });
}

void EffectScheduler::removeFinished()
{
  m_tasks.erase(
      std::remove_if(m_tasks.begin(), m_tasks.end(),
                     [](const Entry &e)
                     { return e.finished; }),
      m_tasks.end());
}
