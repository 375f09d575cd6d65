/**
 * @copyright Copyright The FiniteResource Contributors
 */

#ifndef FINITERESOURCE_SRC_TASK_INCLUDE_SCHEDULER_BASE_HPP_
#define FINITERESOURCE_SRC_TASK_INCLUDE_SCHEDULER_BASE_HPP_

#include <cstddef>

#include "task_control_block.hpp"

/**
 * @brief 就绪队列接口
 *
 * TaskManager 只通过此接口访问就绪任务：
 * CreateTask/Yield/Wakeup/Cancel 入队，RunReady 按 PickNext 的顺序运行
 */
class SchedulerBase {
 public:
  /// 调度器名称
  const char* name = "Unnamed Scheduler";

  /// 入队与选择次数
  struct Stats {
    size_t total_enqueues = 0;
    size_t total_picks = 0;
  };

  /**
   * @brief 任务变为就绪
   * @param task 状态已为 kReady 的任务
   * @return false 队列已满，任务未入队
   */
  virtual auto Enqueue(TaskControlBlock* task) -> bool = 0;

  /**
   * @brief 取出下一个要运行的任务
   * @return TaskControlBlock* 队列为空时为 nullptr
   */
  virtual TaskControlBlock* PickNext() = 0;

  virtual auto GetQueueSize() const -> size_t = 0;
  virtual auto IsEmpty() const -> bool = 0;

  auto GetStats() const -> const Stats& { return stats_; }

  /// @name 构造/析构函数
  /// @{
  SchedulerBase() = default;
  SchedulerBase(const SchedulerBase&) = delete;
  SchedulerBase(SchedulerBase&&) = delete;
  auto operator=(const SchedulerBase&) -> SchedulerBase& = delete;
  auto operator=(SchedulerBase&&) -> SchedulerBase& = delete;
  virtual ~SchedulerBase() = default;
  /// @}

 protected:
  Stats stats_;
};

#endif /* FINITERESOURCE_SRC_TASK_INCLUDE_SCHEDULER_BASE_HPP_ */
