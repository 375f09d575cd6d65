/**
 * @copyright Copyright The FiniteResource Contributors
 */

#include <cassert>
#include <exception>

#include "resource_log.hpp"
#include "task_manager.hpp"
#include "task_messages.hpp"

void TaskManager::Exit(int exit_code) {
  auto* current = GetCurrentTask();
  assert(current != nullptr && "Exit: No current task to exit");
  assert(current->GetStatus() == TaskStatusId::kRunning &&
         "Exit: current task status must be kRunning");

  current->exit_code = exit_code;

  // Transition: kRunning -> kExited
  current->fsm.Receive(MsgExit{exit_code});

  rlog::Debug("Exit: pid=%zu exit_code=%d\n", current->pid, exit_code);

  auto switched = SwitchToScheduler();

  // 退出后不应执行到这里
  rlog::Err("Exit: Task %zu returned to exited context (%s)\n", current->pid,
            switched ? "resumed" : switched.error().message());
  std::terminate();
}
