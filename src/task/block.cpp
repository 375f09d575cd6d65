/**
 * @copyright Copyright The FiniteResource Contributors
 */

#include <cassert>

#include "resource_id.hpp"
#include "resource_log.hpp"
#include "task_manager.hpp"
#include "task_messages.hpp"

auto TaskManager::Block(WakeHandle& handle, ResourceId resource_id)
    -> Expected<void> {
  auto* current = GetCurrentTask();
  if (current == nullptr) {
    rlog::Err("Block: cannot block on resource=%s outside task context\n",
              resource_id.GetTypeName());
    return std::unexpected(Error(ErrorCode::kTaskNoContext));
  }
  assert(current->GetStatus() == TaskStatusId::kRunning &&
         "Block: current task status must be kRunning");

  // 运行期间收到的取消在挂起前送达
  if (ConsumeCancel(current)) {
    handle.Cancel();
    rlog::Debug("Block: pid=%zu cancelled before blocking on resource=%s\n",
                current->pid, resource_id.GetTypeName());
    return std::unexpected(Error(ErrorCode::kTaskCancelled));
  }

  // 已完成的句柄无需挂起
  if (handle.IsDone()) {
    if (handle.IsGranted()) {
      return {};
    }
    return std::unexpected(Error(ErrorCode::kTaskCancelled));
  }

  // Transition: kRunning -> kBlocked
  current->fsm.Receive(MsgBlock{resource_id});
  handle.BindWaiter(current);
  current->blocked_on = resource_id;
  current->wait_handle = &handle;
  current->sched_info.total_blocks++;

  rlog::Debug("Block: pid=%zu blocked on resource=%s, data=%#lx\n",
              current->pid, resource_id.GetTypeName(), resource_id.GetData());

  // 调度到其他任务
  auto switched = SwitchToScheduler();

  // 任务被唤醒后会从这里继续执行
  current->blocked_on = ResourceId{};
  current->wait_handle = nullptr;
  handle.BindWaiter(nullptr);

  if (!switched) {
    // Rollback: kBlocked -> kReady -> kRunning
    handle.Cancel();
    current->fsm.Receive(MsgWakeup{});
    current->fsm.Receive(MsgSchedule{});
    return switched;
  }

  // 取消可能与授予竞争：句柄已授予但任务恢复前收到取消，仍然返回取消
  if (ConsumeCancel(current)) {
    rlog::Debug("Block: pid=%zu cancelled, handle granted=%d\n", current->pid,
                handle.IsGranted());
    return std::unexpected(Error(ErrorCode::kTaskCancelled));
  }

  return {};
}
