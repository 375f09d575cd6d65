/**
 * @copyright Copyright The FiniteResource Contributors
 */

#include "task_fsm.hpp"

#include <gtest/gtest.h>

#include "resource_id.hpp"
#include "task_messages.hpp"

namespace {

class TaskFsmTest : public ::testing::Test {
 protected:
  void SetUp() override { fsm_.Start(); }

  auto State() const -> TaskStatusId {
    return static_cast<TaskStatusId>(fsm_.GetStateId());
  }

  TaskFsm fsm_;
};

TEST_F(TaskFsmTest, StartsUnInit) { EXPECT_EQ(State(), TaskStatusId::kUnInit); }

// 完整生命周期：创建 -> 就绪 -> 运行 -> 阻塞 -> 就绪 -> 运行 -> 退出
TEST_F(TaskFsmTest, FullLifecycle) {
  fsm_.Receive(MsgSchedule{});
  EXPECT_EQ(State(), TaskStatusId::kReady);

  fsm_.Receive(MsgSchedule{});
  EXPECT_EQ(State(), TaskStatusId::kRunning);

  fsm_.Receive(MsgBlock{ResourceId{ResourceType::kResourcePool, 0x1000}});
  EXPECT_EQ(State(), TaskStatusId::kBlocked);

  fsm_.Receive(MsgWakeup{});
  EXPECT_EQ(State(), TaskStatusId::kReady);

  fsm_.Receive(MsgSchedule{});
  EXPECT_EQ(State(), TaskStatusId::kRunning);

  fsm_.Receive(MsgExit{0});
  EXPECT_EQ(State(), TaskStatusId::kExited);
}

TEST_F(TaskFsmTest, YieldReturnsToReady) {
  fsm_.Receive(MsgSchedule{});
  fsm_.Receive(MsgSchedule{});
  ASSERT_EQ(State(), TaskStatusId::kRunning);

  fsm_.Receive(MsgYield{});
  EXPECT_EQ(State(), TaskStatusId::kReady);
}

// 非法消息被忽略，状态不变
TEST_F(TaskFsmTest, UnexpectedMessagesIgnored) {
  fsm_.Receive(MsgWakeup{});
  EXPECT_EQ(State(), TaskStatusId::kUnInit);

  fsm_.Receive(MsgSchedule{});
  fsm_.Receive(MsgExit{1});
  EXPECT_EQ(State(), TaskStatusId::kReady);

  fsm_.Receive(MsgSchedule{});
  fsm_.Receive(MsgWakeup{});
  EXPECT_EQ(State(), TaskStatusId::kRunning);

  fsm_.Receive(MsgBlock{ResourceId{}});
  fsm_.Receive(MsgYield{});
  EXPECT_EQ(State(), TaskStatusId::kBlocked);

  fsm_.Receive(MsgWakeup{});
  fsm_.Receive(MsgSchedule{});
  fsm_.Receive(MsgExit{0});
  fsm_.Receive(MsgSchedule{});
  fsm_.Receive(MsgExit{0});
  EXPECT_EQ(State(), TaskStatusId::kExited);
}

}  // namespace
