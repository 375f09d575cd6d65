/**
 * @copyright Copyright The FiniteResource Contributors
 */

#include "resource_log.hpp"
#include "task_manager.hpp"
#include "task_messages.hpp"

auto TaskManager::RunReady() -> size_t {
  if (running_task_ != nullptr) {
    rlog::Warn("RunReady: called from task %zu, ignored\n",
               running_task_->pid);
    return 0;
  }

  // 只运行本轮开始时已就绪的任务
  size_t pass_size = scheduler_.GetQueueSize();
  size_t ran = 0;

  for (size_t i = 0; i < pass_size; ++i) {
    TaskControlBlock* next = scheduler_.PickNext();
    if (next == nullptr) {
      break;
    }

    auto result = SwitchTo(next);
    if (!result) {
      rlog::Err("RunReady: failed to run pid=%zu: %s\n", next->pid,
                result.error().message());
      continue;
    }
    ran++;

    if (next->GetStatus() == TaskStatusId::kExited) {
      ReapTask(next);
    }
  }

  return ran;
}

auto TaskManager::RunUntilIdle() -> size_t {
  size_t total = 0;
  size_t passes = 0;

  while (!scheduler_.IsEmpty()) {
    if (passes++ >= resource::config::kMaxIdlePasses) {
      rlog::Warn("RunUntilIdle: still %zu ready tasks after %zu passes\n",
                 scheduler_.GetQueueSize(), passes - 1);
      break;
    }
    total += RunReady();
  }

  return total;
}

auto TaskManager::Yield() -> Expected<void> {
  auto* current = GetCurrentTask();
  if (current == nullptr) {
    rlog::Err("Yield: cannot yield outside task context\n");
    return std::unexpected(Error(ErrorCode::kTaskNoContext));
  }

  if (ConsumeCancel(current)) {
    return std::unexpected(Error(ErrorCode::kTaskCancelled));
  }

  // Transition: kRunning -> kReady
  current->fsm.Receive(MsgYield{});
  if (!scheduler_.Enqueue(current)) {
    // Rollback: kReady -> kRunning
    current->fsm.Receive(MsgSchedule{});
    return std::unexpected(Error(ErrorCode::kTaskReadyQueueFull));
  }

  auto switched = SwitchToScheduler();
  if (!switched) {
    return switched;
  }

  if (ConsumeCancel(current)) {
    return std::unexpected(Error(ErrorCode::kTaskCancelled));
  }
  return {};
}
