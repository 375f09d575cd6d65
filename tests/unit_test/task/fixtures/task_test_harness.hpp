/**
 * @copyright Copyright The FiniteResource Contributors
 */

#ifndef FINITERESOURCE_TESTS_UNIT_TEST_TASK_FIXTURES_TASK_TEST_HARNESS_HPP_
#define FINITERESOURCE_TESTS_UNIT_TEST_TASK_FIXTURES_TASK_TEST_HARNESS_HPP_

#include <gtest/gtest.h>

#include "task_control_block.hpp"
#include "task_manager.hpp"

/**
 * @brief Task 与资源池单元测试的基类 Fixture
 *
 * 负责每个测试的 SetUp 和 TearDown，确保测试隔离：
 * 每个测试使用独立的 TaskManager 实例
 */
class TaskTestHarness : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  /// 获取 TaskManager
  auto GetTaskManager() -> TaskManager& {
    return TaskManagerSingleton::instance();
  }

  /**
   * @brief 创建任务，失败时返回 nullptr 并记录测试失败
   */
  auto Spawn(const char* name, ThreadEntry entry, void* arg)
      -> TaskControlBlock*;

  /// 运行一轮调度
  auto RunPass() -> size_t { return GetTaskManager().RunReady(); }

  /// 运行到没有就绪任务
  auto RunUntilIdle() -> size_t { return GetTaskManager().RunUntilIdle(); }

  /// 任务是否已结束
  static auto IsDone(const TaskControlBlock* task) -> bool {
    return task->GetStatus() == TaskStatusId::kExited;
  }
};

#endif /* FINITERESOURCE_TESTS_UNIT_TEST_TASK_FIXTURES_TASK_TEST_HARNESS_HPP_ */
