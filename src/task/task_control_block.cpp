/**
 * @copyright Copyright The FiniteResource Contributors
 */

#include "task_control_block.hpp"

#include <new>

#include "resource_log.hpp"

TaskControlBlock::TaskControlBlock(const char* name, ThreadEntry entry,
                                   void* arg, size_t stack_size)
    : name(name), entry(entry), arg(arg) {
  stack.reset(new (std::nothrow) uint8_t[stack_size]);
  if (stack == nullptr) {
    rlog::Err("TaskControlBlock: failed to allocate %zu bytes stack for %s\n",
              stack_size, name);
  } else {
    this->stack_size = stack_size;
  }
  fsm.Start();
}
