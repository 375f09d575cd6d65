/**
 * @copyright Copyright The FiniteResource Contributors
 */

#include "resource_log.hpp"
#include "task_manager.hpp"
#include "task_messages.hpp"

auto TaskManager::Cancel(TaskControlBlock* task) -> Expected<void> {
  if (task == nullptr) {
    return std::unexpected(Error(ErrorCode::kInvalidArgument));
  }

  if (task->GetStatus() == TaskStatusId::kExited) {
    rlog::Warn("Cancel: pid=%zu already exited\n", task->pid);
    return std::unexpected(Error(ErrorCode::kTaskAlreadyExited));
  }

  task->cancel_requested = true;

  if (task->GetStatus() == TaskStatusId::kBlocked) {
    // 取消等待的句柄，并让任务在下一轮运行以接收取消
    if (task->wait_handle != nullptr) {
      task->wait_handle->Cancel();
    }
    // Transition: kBlocked -> kReady
    task->fsm.Receive(MsgWakeup{});
    if (!scheduler_.Enqueue(task)) {
      return std::unexpected(Error(ErrorCode::kTaskReadyQueueFull));
    }
  }

  rlog::Debug("Cancel: pid=%zu cancel requested\n", task->pid);
  return {};
}
