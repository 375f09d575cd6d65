/**
 * @copyright Copyright The FiniteResource Contributors
 */

#ifndef FINITERESOURCE_SRC_TASK_INCLUDE_FIFO_SCHEDULER_HPP_
#define FINITERESOURCE_SRC_TASK_INCLUDE_FIFO_SCHEDULER_HPP_

#include <etl/list.h>

#include "resource_config.hpp"
#include "resource_log.hpp"
#include "scheduler_base.hpp"
#include "task_control_block.hpp"

/**
 * @brief 先来先服务 (FIFO) 调度器
 *
 * FIFO 调度器特点：
 * - 先进先出
 * - 不可抢占，任务运行直到主动让出、阻塞或退出
 * - O(1) 时间复杂度
 */
class FifoScheduler : public SchedulerBase {
 public:
  /**
   * @brief 构造函数
   */
  FifoScheduler() { name = "FIFO"; }

  /**
   * @brief 将任务加入就绪队列尾部
   * @param task 要加入的任务
   */
  auto Enqueue(TaskControlBlock* task) -> bool override {
    if (ready_queue_.full()) {
      rlog::Err("FifoScheduler::Enqueue: ready_queue full, dropping task %zu\n",
                task->pid);
      return false;
    }
    ready_queue_.push_back(task);
    stats_.total_enqueues++;
    return true;
  }

  /**
   * @brief 选择下一个要运行的任务（队列头部）
   * @return 下一个任务，如果队列为空则返回 nullptr
   */
  TaskControlBlock* PickNext() override {
    if (ready_queue_.empty()) {
      return nullptr;
    }
    TaskControlBlock* next = ready_queue_.front();
    ready_queue_.pop_front();
    stats_.total_picks++;
    return next;
  }

  auto GetQueueSize() const -> size_t override { return ready_queue_.size(); }

  auto IsEmpty() const -> bool override { return ready_queue_.empty(); }

  /// @name 构造/析构函数
  /// @{
  FifoScheduler(const FifoScheduler&) = delete;
  FifoScheduler(FifoScheduler&&) = delete;
  auto operator=(const FifoScheduler&) -> FifoScheduler& = delete;
  auto operator=(FifoScheduler&&) -> FifoScheduler& = delete;
  ~FifoScheduler() override = default;
  /// @}

 private:
  /// 就绪队列 (先进先出，固定容量)
  etl::list<TaskControlBlock*, resource::config::kMaxReadyTasks> ready_queue_;
};

#endif /* FINITERESOURCE_SRC_TASK_INCLUDE_FIFO_SCHEDULER_HPP_ */
