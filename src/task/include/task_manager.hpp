/**
 * @copyright Copyright The FiniteResource Contributors
 */

#ifndef FINITERESOURCE_SRC_TASK_INCLUDE_TASK_MANAGER_HPP_
#define FINITERESOURCE_SRC_TASK_INCLUDE_TASK_MANAGER_HPP_

#include <etl/memory.h>
#include <etl/singleton.h>
#include <etl/unordered_map.h>
#include <ucontext.h>

#include <cstddef>
#include <cstdint>

#include "expected.hpp"
#include "fifo_scheduler.hpp"
#include "resource_config.hpp"
#include "resource_id.hpp"
#include "task_control_block.hpp"
#include "wake_handle.hpp"

/**
 * @brief 任务管理器
 *
 * 单线程协作式调度器：
 * - 同一时刻只有一个任务在运行，运行到下一个挂起点（Block/Yield/Exit）为止
 * - 挂起点之间的代码不会被打断，因此资源池内部无需加锁
 * - 调度循环由调用方驱动（RunReady/RunUntilIdle），调度循环本身不在任务上下文中
 */
class TaskManager {
 public:
  /**
   * @brief 创建任务并加入就绪队列
   * @param name 任务名称
   * @param entry 入口函数
   * @param arg 入口函数参数
   * @return Expected<TaskControlBlock*> 新任务，失败返回错误
   * @note 任务表已满时回收已退出任务的记录，之前返回的已退出任务指针随之失效
   */
  auto CreateTask(const char* name, ThreadEntry entry, void* arg)
      -> Expected<TaskControlBlock*>;

  /**
   * @brief 运行一轮调度
   *
   * 本轮开始时处于就绪状态的每个任务各运行一次，直到其下一个挂起点。
   * 本轮中新变为就绪的任务在下一轮运行。
   *
   * @return size_t 本轮运行的任务数
   * @note 必须在任务上下文之外调用
   */
  auto RunReady() -> size_t;

  /**
   * @brief 反复调用 RunReady 直到没有就绪任务
   * @return size_t 总共运行的任务次数
   */
  auto RunUntilIdle() -> size_t;

  /**
   * @brief 获取当前任务
   * @return TaskControlBlock* 当前正在运行的任务，不在任务上下文中时为 nullptr
   */
  TaskControlBlock* GetCurrentTask() const { return running_task_; }

  /**
   * @brief 当前任务让出 CPU，回到就绪队列尾部
   * @return Expected<void> 取消已送达时返回 kTaskCancelled
   */
  auto Yield() -> Expected<void>;

  /**
   * @brief 阻塞当前任务，直到 handle 完成
   * @param handle 等待的唤醒句柄
   * @param resource_id 等待的资源 ID（用于调试）
   * @return Expected<void> 被授予返回成功；取消送达返回 kTaskCancelled，
   * 即使 handle 在任务恢复前已被授予
   */
  auto Block(WakeHandle& handle, ResourceId resource_id) -> Expected<void>;

  /**
   * @brief 授予 handle 并唤醒等待它的任务
   * @param handle 唤醒句柄
   * @return true  handle 由 kPending 变为 kGranted
   * @return false handle 已完成
   */
  auto Wakeup(WakeHandle& handle) -> bool;

  /**
   * @brief 请求取消任务
   *
   * - 阻塞中的任务：取消其 handle 并置为就绪，Block 返回 kTaskCancelled
   * - 就绪或运行中的任务：在下一个挂起点返回 kTaskCancelled
   * - 尚未启动的任务：不再执行入口函数，直接退出
   *
   * @param task 目标任务
   * @return Expected<void> 已退出的任务返回 kTaskAlreadyExited
   */
  auto Cancel(TaskControlBlock* task) -> Expected<void>;

  /**
   * @brief 退出当前任务
   * @param exit_code 退出码
   */
  [[noreturn]] void Exit(int exit_code = 0);

  /**
   * @brief 按 PID 查找任务
   * @param pid 任务 ID
   * @return TaskControlBlock* 找到的任务，未找到返回 nullptr
   */
  TaskControlBlock* FindTask(Pid pid);

  /// 就绪任务数
  auto GetReadyCount() const -> size_t { return scheduler_.GetQueueSize(); }

  /// 调度器统计信息
  auto GetSchedulerStats() const -> const SchedulerBase::Stats& {
    return scheduler_.GetStats();
  }

  /// @name 构造/析构函数
  /// @{
  TaskManager() = default;
  TaskManager(const TaskManager&) = delete;
  TaskManager(TaskManager&&) = delete;
  auto operator=(const TaskManager&) -> TaskManager& = delete;
  auto operator=(TaskManager&&) -> TaskManager& = delete;
  ~TaskManager() = default;
  /// @}

 private:
  /// 就绪队列
  FifoScheduler scheduler_;

  /// 全局任务表 (PID -> TCB 映射)
  etl::unordered_map<Pid, etl::unique_ptr<TaskControlBlock>,
                     resource::config::kMaxTasks,
                     resource::config::kMaxTasksBuckets>
      task_table_;

  /// 当前运行的任务
  TaskControlBlock* running_task_ = nullptr;

  /// 调度循环的上下文
  ucontext_t scheduler_context_{};

  /// PID 分配器
  Pid pid_allocator_ = 1;

  /**
   * @brief 分配新的 PID
   * @return Pid 新的 PID
   */
  Pid AllocatePid();

  /**
   * @brief 从调度循环切换到 task，直到 task 挂起或退出
   * @param task 要运行的任务
   * @return Expected<void> 上下文切换失败返回 kTaskSwitchFailed
   */
  auto SwitchTo(TaskControlBlock* task) -> Expected<void>;

  /**
   * @brief 从当前任务切换回调度循环
   * @return Expected<void> 上下文切换失败返回 kTaskSwitchFailed
   */
  auto SwitchToScheduler() -> Expected<void>;

  /**
   * @brief 取出并清除当前任务待送达的取消请求
   * @return true 有取消请求
   */
  auto ConsumeCancel(TaskControlBlock* task) -> bool;

  /**
   * @brief 释放已退出任务的栈
   * @param task 已退出的任务
   */
  void ReapTask(TaskControlBlock* task);

  /**
   * @brief 从任务表中删除已退出的任务
   * @return size_t 删除的任务数
   */
  auto ReclaimExited() -> size_t;

  /// 任务入口跳板，在新任务的栈上运行
  static void TaskTrampoline();
};

using TaskManagerSingleton = etl::singleton<TaskManager>;

#endif  // FINITERESOURCE_SRC_TASK_INCLUDE_TASK_MANAGER_HPP_
