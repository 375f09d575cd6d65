/**
 * @copyright Copyright The FiniteResource Contributors
 */

#include "task_manager.hpp"

#include <cassert>
#include <memory>
#include <new>

#include "resource_log.hpp"
#include "task_messages.hpp"

auto TaskManager::CreateTask(const char* name, ThreadEntry entry, void* arg)
    -> Expected<TaskControlBlock*> {
  if (entry == nullptr) {
    rlog::Err("CreateTask: task '%s' has no entry\n", name);
    return std::unexpected(Error(ErrorCode::kInvalidArgument));
  }

  if (task_table_.full() && ReclaimExited() == 0) {
    rlog::Err("CreateTask: task_table_ full, cannot add task '%s'\n", name);
    return std::unexpected(Error(ErrorCode::kTaskTableFull));
  }

  std::unique_ptr<TaskControlBlock> task(new (std::nothrow) TaskControlBlock(
      name, entry, arg, resource::config::kTaskStackSize));
  if (task == nullptr || task->stack == nullptr) {
    return std::unexpected(Error(ErrorCode::kOutOfMemory));
  }

  // 准备任务上下文，从 TaskTrampoline 开始执行
  if (getcontext(&task->task_context) != 0) {
    rlog::Err("CreateTask: getcontext failed for task '%s'\n", name);
    return std::unexpected(Error(ErrorCode::kTaskSwitchFailed));
  }
  task->task_context.uc_stack.ss_sp = task->stack.get();
  task->task_context.uc_stack.ss_size = task->stack_size;
  task->task_context.uc_link = &scheduler_context_;
  makecontext(&task->task_context, &TaskManager::TaskTrampoline, 0);

  task->pid = AllocatePid();

  // Transition: kUnInit -> kReady
  task->fsm.Receive(MsgSchedule{});
  if (!scheduler_.Enqueue(task.get())) {
    return std::unexpected(Error(ErrorCode::kTaskReadyQueueFull));
  }

  auto* raw = task.release();
  task_table_[raw->pid] = etl::unique_ptr<TaskControlBlock>(raw);

  rlog::Debug("CreateTask: pid=%zu name=%s\n", raw->pid, raw->name);
  return raw;
}

TaskControlBlock* TaskManager::FindTask(Pid pid) {
  auto it = task_table_.find(pid);
  return (it != task_table_.end()) ? it->second.get() : nullptr;
}

Pid TaskManager::AllocatePid() { return pid_allocator_++; }

auto TaskManager::SwitchTo(TaskControlBlock* task) -> Expected<void> {
  assert(running_task_ == nullptr && "SwitchTo: already in task context");
  assert(task->GetStatus() == TaskStatusId::kReady &&
         "SwitchTo: task status must be kReady");

  // Transition: kReady -> kRunning
  task->fsm.Receive(MsgSchedule{});
  task->sched_info.context_switches++;
  running_task_ = task;

  if (swapcontext(&scheduler_context_, &task->task_context) != 0) {
    running_task_ = nullptr;
    rlog::Err("SwitchTo: swapcontext to pid=%zu failed\n", task->pid);
    return std::unexpected(Error(ErrorCode::kTaskSwitchFailed));
  }

  // 任务挂起或退出后回到这里
  running_task_ = nullptr;
  return {};
}

auto TaskManager::SwitchToScheduler() -> Expected<void> {
  auto* current = GetCurrentTask();
  assert(current != nullptr && "SwitchToScheduler: no current task");

  if (swapcontext(&current->task_context, &scheduler_context_) != 0) {
    rlog::Err("SwitchToScheduler: swapcontext from pid=%zu failed\n",
              current->pid);
    return std::unexpected(Error(ErrorCode::kTaskSwitchFailed));
  }

  // 再次被调度后从这里继续执行
  return {};
}

auto TaskManager::ConsumeCancel(TaskControlBlock* task) -> bool {
  if (!task->cancel_requested) {
    return false;
  }
  task->cancel_requested = false;
  task->cancel_delivered = true;
  return true;
}

void TaskManager::ReapTask(TaskControlBlock* task) {
  assert(task->GetStatus() == TaskStatusId::kExited &&
         "ReapTask: task status must be kExited");
  task->stack.reset();
  task->stack_size = 0;
  rlog::Debug("ReapTask: pid=%zu exit_code=%d\n", task->pid, task->exit_code);
}

auto TaskManager::ReclaimExited() -> size_t {
  size_t reclaimed = 0;
  auto it = task_table_.begin();
  while (it != task_table_.end()) {
    if (it->second->GetStatus() == TaskStatusId::kExited) {
      it = task_table_.erase(it);
      reclaimed++;
    } else {
      ++it;
    }
  }
  rlog::Debug("ReclaimExited: %zu task records freed\n", reclaimed);
  return reclaimed;
}

void TaskManager::TaskTrampoline() {
  auto& task_manager = TaskManagerSingleton::instance();
  auto* current = task_manager.GetCurrentTask();

  // 启动前已被取消的任务不执行入口函数
  if (task_manager.ConsumeCancel(current)) {
    rlog::Debug("TaskTrampoline: pid=%zu cancelled before start\n",
                current->pid);
    task_manager.Exit();
  }

  current->entry(current->arg);
  task_manager.Exit();
}
