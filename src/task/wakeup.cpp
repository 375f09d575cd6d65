/**
 * @copyright Copyright The FiniteResource Contributors
 */

#include "resource_log.hpp"
#include "task_manager.hpp"
#include "task_messages.hpp"

auto TaskManager::Wakeup(WakeHandle& handle) -> bool {
  if (!handle.Complete()) {
    return false;
  }

  auto* task = handle.GetWaiter();
  if (task == nullptr) {
    // 还没有任务等待，之后的 Block 会直接返回
    return true;
  }

  if (task->GetStatus() != TaskStatusId::kBlocked ||
      task->wait_handle != &handle) {
    rlog::Warn("Wakeup: pid=%zu is not blocked on this handle\n", task->pid);
    return true;
  }

  // Transition: kBlocked -> kReady
  task->fsm.Receive(MsgWakeup{});
  if (!scheduler_.Enqueue(task)) {
    rlog::Err("Wakeup: failed to enqueue pid=%zu\n", task->pid);
    return true;
  }

  rlog::Debug("Wakeup: pid=%zu woken from resource=%s\n", task->pid,
              task->blocked_on.GetTypeName());
  return true;
}
