/**
 * @copyright Copyright The FiniteResource Contributors
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <vector>

#include "expected.hpp"
#include "resource_config.hpp"
#include "task_control_block.hpp"
#include "task_manager.hpp"
#include "task_test_harness.hpp"

namespace {

/// 记录执行轨迹的任务参数
struct TraceArgs {
  std::vector<int>* trace = nullptr;
  int id = 0;
  int yields = 0;
};

void TraceEntry(void* arg) {
  auto* args = static_cast<TraceArgs*>(arg);
  args->trace->push_back(args->id);
  for (int i = 0; i < args->yields; ++i) {
    auto result = TaskManagerSingleton::instance().Yield();
    if (!result) {
      return;
    }
    args->trace->push_back(args->id);
  }
}

void ExitEntry(void* arg) {
  auto* counter = static_cast<int*>(arg);
  ++*counter;
  TaskManagerSingleton::instance().Exit(7);
}

/// 在运行中创建新任务
struct SpawnArgs {
  std::vector<int>* trace = nullptr;
  TraceArgs child;
  TaskControlBlock* child_task = nullptr;
};

void SpawnEntry(void* arg) {
  auto* args = static_cast<SpawnArgs*>(arg);
  args->trace->push_back(0);
  auto result = TaskManagerSingleton::instance().CreateTask(
      "child", TraceEntry, &args->child);
  if (result) {
    args->child_task = *result;
  }
}

void NestedRunEntry(void* arg) {
  auto* ran = static_cast<size_t*>(arg);
  *ran = TaskManagerSingleton::instance().RunReady();
}

class ScheduleTest : public TaskTestHarness {};

/**
 * @brief 任务按创建顺序运行
 */
TEST_F(ScheduleTest, RunsInCreationOrder) {
  std::vector<int> trace;
  TraceArgs a{&trace, 1};
  TraceArgs b{&trace, 2};
  TraceArgs c{&trace, 3};

  auto* task_a = Spawn("a", TraceEntry, &a);
  auto* task_b = Spawn("b", TraceEntry, &b);
  auto* task_c = Spawn("c", TraceEntry, &c);
  ASSERT_NE(task_c, nullptr);

  EXPECT_EQ(task_a->GetStatus(), TaskStatusId::kReady);
  EXPECT_EQ(GetTaskManager().GetReadyCount(), 3);

  EXPECT_EQ(RunPass(), 3);
  EXPECT_THAT(trace, ::testing::ElementsAre(1, 2, 3));
  EXPECT_TRUE(IsDone(task_a));
  EXPECT_TRUE(IsDone(task_b));
  EXPECT_TRUE(IsDone(task_c));
  EXPECT_EQ(GetTaskManager().GetReadyCount(), 0);
}

/**
 * @brief Yield 后的任务在下一轮运行
 */
TEST_F(ScheduleTest, YieldDefersToNextPass) {
  std::vector<int> trace;
  TraceArgs a{&trace, 1, 2};
  TraceArgs b{&trace, 2, 1};

  auto* task_a = Spawn("a", TraceEntry, &a);
  auto* task_b = Spawn("b", TraceEntry, &b);
  ASSERT_NE(task_b, nullptr);

  EXPECT_EQ(RunPass(), 2);
  EXPECT_THAT(trace, ::testing::ElementsAre(1, 2));
  EXPECT_EQ(task_a->GetStatus(), TaskStatusId::kReady);

  EXPECT_EQ(RunPass(), 2);
  EXPECT_THAT(trace, ::testing::ElementsAre(1, 2, 1, 2));
  EXPECT_TRUE(IsDone(task_b));

  EXPECT_EQ(RunPass(), 1);
  EXPECT_THAT(trace, ::testing::ElementsAre(1, 2, 1, 2, 1));
  EXPECT_TRUE(IsDone(task_a));
  EXPECT_EQ(task_a->sched_info.context_switches, 3);
}

/**
 * @brief 本轮中创建的任务在下一轮运行
 */
TEST_F(ScheduleTest, TaskCreatedDuringPassRunsNextPass) {
  std::vector<int> trace;
  SpawnArgs parent{&trace, TraceArgs{&trace, 9}};

  ASSERT_NE(Spawn("parent", SpawnEntry, &parent), nullptr);

  EXPECT_EQ(RunPass(), 1);
  EXPECT_THAT(trace, ::testing::ElementsAre(0));
  ASSERT_NE(parent.child_task, nullptr);
  EXPECT_EQ(parent.child_task->GetStatus(), TaskStatusId::kReady);

  EXPECT_EQ(RunUntilIdle(), 1);
  EXPECT_THAT(trace, ::testing::ElementsAre(0, 9));
}

TEST_F(ScheduleTest, ExitRecordsCodeAndReleasesStack) {
  int counter = 0;
  auto* task = Spawn("exit", ExitEntry, &counter);
  ASSERT_NE(task, nullptr);
  EXPECT_NE(task->stack.get(), nullptr);

  RunUntilIdle();
  EXPECT_EQ(counter, 1);
  EXPECT_TRUE(IsDone(task));
  EXPECT_EQ(task->exit_code, 7);
  EXPECT_EQ(task->stack.get(), nullptr);
  EXPECT_FALSE(task->IsCancelled());
}

TEST_F(ScheduleTest, FindTaskByPid) {
  int counter = 0;
  auto* first = Spawn("first", ExitEntry, &counter);
  auto* second = Spawn("second", ExitEntry, &counter);
  ASSERT_NE(first, nullptr);
  ASSERT_NE(second, nullptr);

  EXPECT_NE(first->pid, second->pid);
  EXPECT_EQ(GetTaskManager().FindTask(first->pid), first);
  EXPECT_EQ(GetTaskManager().FindTask(second->pid), second);
  EXPECT_EQ(GetTaskManager().FindTask(0), nullptr);
}

/**
 * @brief 已退出任务的记录在任务表满时被回收，可以持续创建任务
 */
TEST_F(ScheduleTest, CreatesTasksBeyondTableCapacityOverTime) {
  int counter = 0;
  const size_t total = resource::config::kMaxTasks * 2 + 1;

  for (size_t i = 0; i < total; ++i) {
    auto created = GetTaskManager().CreateTask("worker", ExitEntry, &counter);
    ASSERT_TRUE(created.has_value()) << "task " << i << ": "
                                     << created.error().message();
    RunUntilIdle();
  }
  EXPECT_EQ(counter, static_cast<int>(total));
}

/**
 * @brief 任务表被未退出的任务占满时拒绝创建
 */
TEST_F(ScheduleTest, TableFullOfLiveTasks) {
  int counter = 0;
  Pid first_pid = 0;
  for (size_t i = 0; i < resource::config::kMaxTasks; ++i) {
    auto created = GetTaskManager().CreateTask("worker", ExitEntry, &counter);
    ASSERT_TRUE(created.has_value());
    if (i == 0) {
      first_pid = (*created)->pid;
    }
  }

  auto rejected = GetTaskManager().CreateTask("extra", ExitEntry, &counter);
  ASSERT_FALSE(rejected.has_value());
  EXPECT_EQ(rejected.error().code, ErrorCode::kTaskTableFull);

  RunUntilIdle();
  EXPECT_EQ(counter, static_cast<int>(resource::config::kMaxTasks));
  EXPECT_NE(GetTaskManager().FindTask(first_pid), nullptr);

  // 所有任务已退出，创建时回收它们的记录
  auto created = GetTaskManager().CreateTask("extra", ExitEntry, &counter);
  ASSERT_TRUE(created.has_value());
  EXPECT_EQ(GetTaskManager().FindTask(first_pid), nullptr);
  EXPECT_EQ(GetTaskManager().FindTask((*created)->pid), *created);
}

TEST_F(ScheduleTest, CreateTaskRejectsNullEntry) {
  auto result = GetTaskManager().CreateTask("null", nullptr, nullptr);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kInvalidArgument);
}

TEST_F(ScheduleTest, YieldOutsideTaskContext) {
  auto result = GetTaskManager().Yield();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kTaskNoContext);
  EXPECT_EQ(GetTaskManager().GetCurrentTask(), nullptr);
}

/**
 * @brief 任务内部调用 RunReady 被忽略
 */
TEST_F(ScheduleTest, RunReadyInsideTaskIgnored) {
  size_t ran = 1;
  ASSERT_NE(Spawn("nested", NestedRunEntry, &ran), nullptr);

  EXPECT_EQ(RunPass(), 1);
  EXPECT_EQ(ran, 0);
}

/**
 * @brief 相互 Yield 的任务在达到轮数上限后停止
 */
TEST_F(ScheduleTest, RunUntilIdleStopsAfterPassLimit) {
  std::vector<int> trace;
  TraceArgs spinner{&trace, 1,
                    static_cast<int>(resource::config::kMaxIdlePasses) + 8};
  auto* task = Spawn("spinner", TraceEntry, &spinner);
  ASSERT_NE(task, nullptr);

  EXPECT_EQ(RunUntilIdle(), resource::config::kMaxIdlePasses);
  EXPECT_EQ(task->GetStatus(), TaskStatusId::kReady);

  // 取消后下一次 Yield 返回，任务结束
  ASSERT_TRUE(GetTaskManager().Cancel(task).has_value());
  RunUntilIdle();
  EXPECT_TRUE(IsDone(task));
  EXPECT_TRUE(task->IsCancelled());
}

TEST_F(ScheduleTest, SchedulerStatistics) {
  std::vector<int> trace;
  TraceArgs a{&trace, 1, 1};
  ASSERT_NE(Spawn("a", TraceEntry, &a), nullptr);

  RunUntilIdle();
  const auto& stats = GetTaskManager().GetSchedulerStats();
  EXPECT_EQ(stats.total_enqueues, 2);
  EXPECT_EQ(stats.total_picks, 2);
}

}  // namespace
