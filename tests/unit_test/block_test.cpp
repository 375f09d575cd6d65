/**
 * @copyright Copyright The FiniteResource Contributors
 */

#include <gtest/gtest.h>

#include <cstdint>

#include "expected.hpp"
#include "resource_id.hpp"
#include "task_test_harness.hpp"
#include "task_control_block.hpp"
#include "task_manager.hpp"
#include "wake_handle.hpp"

namespace {

/// 阻塞任务的参数
struct BlockArgs {
  WakeHandle* handle = nullptr;
  ResourceId resource_id{};
  bool returned = false;
  ErrorCode error = ErrorCode::kSuccess;
};

void BlockEntry(void* arg) {
  auto* args = static_cast<BlockArgs*>(arg);
  auto result =
      TaskManagerSingleton::instance().Block(*args->handle, args->resource_id);
  args->returned = true;
  if (!result) {
    args->error = result.error().code;
  }
}

/**
 * @brief 测试资源 ID 的编码
 */
TEST(ResourceIdTest, TypeAndData) {
  ResourceId pool_id{ResourceType::kResourcePool, 0x1234};
  EXPECT_EQ(pool_id.GetType(), ResourceType::kResourcePool);
  EXPECT_EQ(pool_id.GetData(), 0x1234);
  EXPECT_STREQ(pool_id.GetTypeName(), "ResourcePool");
  EXPECT_TRUE(static_cast<bool>(pool_id));

  ResourceId bounded_id{ResourceType::kBoundedResourcePool, 0x1234};
  EXPECT_NE(pool_id, bounded_id);
  EXPECT_STREQ(bounded_id.GetTypeName(), "BoundedResourcePool");

  ResourceId none{};
  EXPECT_EQ(none.GetType(), ResourceType::kNone);
  EXPECT_FALSE(static_cast<bool>(none));
}

/**
 * @brief 数据部分只保留低 56 位
 */
TEST(ResourceIdTest, DataIsMasked) {
  ResourceId id{ResourceType::kWakeHandle, 0xFF00000000001234ULL};
  EXPECT_EQ(id.GetType(), ResourceType::kWakeHandle);
  EXPECT_EQ(id.GetData(), 0x1234ULL);
}

/**
 * @brief WakeHandle 只能完成一次
 */
TEST(WakeHandleTest, CompletesOnce) {
  WakeHandle granted;
  EXPECT_EQ(granted.GetState(), WakeState::kPending);
  EXPECT_FALSE(granted.IsDone());
  EXPECT_TRUE(granted.Complete());
  EXPECT_TRUE(granted.IsGranted());
  EXPECT_FALSE(granted.Cancel());
  EXPECT_FALSE(granted.Complete());
  EXPECT_TRUE(granted.IsGranted());

  WakeHandle cancelled;
  EXPECT_TRUE(cancelled.Cancel());
  EXPECT_TRUE(cancelled.IsDone());
  EXPECT_TRUE(cancelled.IsCancelled());
  EXPECT_FALSE(cancelled.Complete());
  EXPECT_FALSE(cancelled.IsGranted());
}

class BlockTest : public TaskTestHarness {};

/**
 * @brief 任务阻塞后由 Wakeup 唤醒
 */
TEST_F(BlockTest, BlockUntilWakeup) {
  WakeHandle handle;
  BlockArgs args{&handle, ResourceId{ResourceType::kWakeHandle, 0x42}};

  auto* task = Spawn("blocker", BlockEntry, &args);
  ASSERT_NE(task, nullptr);

  RunPass();
  EXPECT_EQ(task->GetStatus(), TaskStatusId::kBlocked);
  EXPECT_EQ(task->blocked_on.GetType(), ResourceType::kWakeHandle);
  EXPECT_EQ(task->blocked_on.GetData(), 0x42);
  EXPECT_EQ(task->wait_handle, &handle);
  EXPECT_EQ(handle.GetWaiter(), task);
  EXPECT_EQ(task->sched_info.total_blocks, 1);
  EXPECT_FALSE(args.returned);

  // 阻塞的任务不会被再次调度
  EXPECT_EQ(RunPass(), 0);

  EXPECT_TRUE(GetTaskManager().Wakeup(handle));
  EXPECT_EQ(task->GetStatus(), TaskStatusId::kReady);
  EXPECT_FALSE(GetTaskManager().Wakeup(handle));

  RunUntilIdle();
  EXPECT_TRUE(args.returned);
  EXPECT_EQ(args.error, ErrorCode::kSuccess);
  EXPECT_TRUE(IsDone(task));
  EXPECT_FALSE(task->blocked_on);
  EXPECT_EQ(task->wait_handle, nullptr);
}

/**
 * @brief 已完成的句柄不会挂起任务
 */
TEST_F(BlockTest, AlreadyGrantedHandleDoesNotSuspend) {
  WakeHandle handle;
  EXPECT_TRUE(GetTaskManager().Wakeup(handle));

  BlockArgs args{&handle, ResourceId{ResourceType::kWakeHandle, 0}};
  auto* task = Spawn("granted", BlockEntry, &args);
  ASSERT_NE(task, nullptr);

  RunPass();
  EXPECT_TRUE(IsDone(task));
  EXPECT_TRUE(args.returned);
  EXPECT_EQ(args.error, ErrorCode::kSuccess);
  EXPECT_EQ(task->sched_info.total_blocks, 0);
}

TEST_F(BlockTest, AlreadyCancelledHandleReturnsCancelled) {
  WakeHandle handle;
  EXPECT_TRUE(handle.Cancel());

  BlockArgs args{&handle, ResourceId{ResourceType::kWakeHandle, 0}};
  auto* task = Spawn("cancelled_handle", BlockEntry, &args);
  ASSERT_NE(task, nullptr);

  RunPass();
  EXPECT_TRUE(IsDone(task));
  EXPECT_EQ(args.error, ErrorCode::kTaskCancelled);
}

/**
 * @brief 不在任务上下文中不能阻塞
 */
TEST_F(BlockTest, BlockOutsideTaskContext) {
  WakeHandle handle;
  auto result = GetTaskManager().Block(handle, ResourceId{});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kTaskNoContext);
  EXPECT_FALSE(handle.IsDone());
}

/**
 * @brief 多个任务按唤醒顺序恢复
 */
TEST_F(BlockTest, WakeupOrderDeterminesResumeOrder) {
  WakeHandle first_handle;
  WakeHandle second_handle;
  BlockArgs first{&first_handle, ResourceId{ResourceType::kWakeHandle, 1}};
  BlockArgs second{&second_handle, ResourceId{ResourceType::kWakeHandle, 2}};

  auto* first_task = Spawn("first", BlockEntry, &first);
  auto* second_task = Spawn("second", BlockEntry, &second);
  ASSERT_NE(first_task, nullptr);
  ASSERT_NE(second_task, nullptr);

  EXPECT_EQ(RunPass(), 2);

  EXPECT_TRUE(GetTaskManager().Wakeup(second_handle));
  RunPass();
  EXPECT_TRUE(IsDone(second_task));
  EXPECT_EQ(first_task->GetStatus(), TaskStatusId::kBlocked);

  EXPECT_TRUE(GetTaskManager().Wakeup(first_handle));
  RunPass();
  EXPECT_TRUE(IsDone(first_task));
}

}  // namespace
