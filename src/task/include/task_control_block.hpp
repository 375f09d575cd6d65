/**
 * @copyright Copyright The FiniteResource Contributors
 */

#ifndef FINITERESOURCE_SRC_TASK_INCLUDE_TASK_CONTROL_BLOCK_HPP_
#define FINITERESOURCE_SRC_TASK_INCLUDE_TASK_CONTROL_BLOCK_HPP_

#include <ucontext.h>

#include <cstddef>
#include <cstdint>
#include <memory>

#include "resource_id.hpp"
#include "task_fsm.hpp"
#include "wake_handle.hpp"

/// 任务 ID 类型
using Pid = size_t;

/// 任务入口函数类型
using ThreadEntry = void (*)(void*);

/**
 * @brief 任务控制块，管理协作式任务的核心数据结构
 */
struct TaskControlBlock {
  /// 任务名称
  const char* name = "Unnamed Task";

  /// 任务 ID
  Pid pid = 0;

  /// 退出码
  int exit_code = 0;

  /// 入口函数
  ThreadEntry entry = nullptr;
  /// 入口函数参数
  void* arg = nullptr;

  /// 任务栈
  std::unique_ptr<uint8_t[]> stack;
  /// 任务栈大小
  size_t stack_size = 0;

  /// 任务上下文
  ucontext_t task_context{};

  /// 等待的资源 ID
  ResourceId blocked_on{};
  /// 等待的唤醒句柄，未阻塞时为 nullptr
  WakeHandle* wait_handle = nullptr;

  /// 已请求取消，尚未送达
  bool cancel_requested = false;
  /// 取消已送达任务（Block/Yield 返回 kTaskCancelled，或任务未启动即退出）
  bool cancel_delivered = false;

  /**
   * @brief 基础调度信息
   */
  struct SchedInfo {
    /// 上下文切换次数
    uint64_t context_switches = 0;
    /// 阻塞次数
    uint64_t total_blocks = 0;
  } sched_info;

  /// 任务状态机
  TaskFsm fsm;

  /// 获取任务状态
  auto GetStatus() const -> TaskStatusId {
    return static_cast<TaskStatusId>(fsm.GetStateId());
  }

  /// 任务是否因取消而结束
  auto IsCancelled() const -> bool {
    return cancel_delivered && GetStatus() == TaskStatusId::kExited;
  }

  /**
   * @brief 构造函数
   * @param name 任务名称
   * @param entry 入口函数
   * @param arg 入口函数参数
   * @param stack_size 栈大小
   * @note 栈分配失败时 stack 为 nullptr
   */
  TaskControlBlock(const char* name, ThreadEntry entry, void* arg,
                   size_t stack_size);

  /// @name 构造/析构函数
  /// @{
  TaskControlBlock(const TaskControlBlock&) = delete;
  TaskControlBlock(TaskControlBlock&&) = delete;
  auto operator=(const TaskControlBlock&) -> TaskControlBlock& = delete;
  auto operator=(TaskControlBlock&&) -> TaskControlBlock& = delete;
  ~TaskControlBlock() = default;
  /// @}
};

#endif /* FINITERESOURCE_SRC_TASK_INCLUDE_TASK_CONTROL_BLOCK_HPP_ */
