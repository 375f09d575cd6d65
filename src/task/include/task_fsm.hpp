/** @copyright Copyright The FiniteResource Contributors */

#ifndef FINITERESOURCE_SRC_TASK_INCLUDE_TASK_FSM_HPP_
#define FINITERESOURCE_SRC_TASK_INCLUDE_TASK_FSM_HPP_

#include <etl/fsm.h>

#include "task_messages.hpp"

/// 任务状态 ID — 用作 etl::fsm 的状态 ID
enum TaskStatusId : uint8_t {
  kUnInit = 0,
  kReady = 1,
  kRunning = 2,
  kBlocked = 3,
  kExited = 4,
  kTaskStatusCount = 5,
};

// 前向声明所有状态类，以便在转换表中相互引用
struct StateUnInit;
struct StateReady;
struct StateRunning;
struct StateBlocked;
struct StateExited;

/// 状态：UnInit — 任务尚未加入调度
struct StateUnInit : public etl::fsm_state<etl::fsm, StateUnInit,
                                           TaskStatusId::kUnInit, MsgSchedule> {
  auto on_event(const MsgSchedule& msg) -> etl::fsm_state_id_t;
  auto on_event_unknown(const etl::imessage& msg) -> etl::fsm_state_id_t;
};

/// 状态：Ready — 任务已就绪，等待调度
struct StateReady : public etl::fsm_state<etl::fsm, StateReady,
                                          TaskStatusId::kReady, MsgSchedule> {
  auto on_event(const MsgSchedule& msg) -> etl::fsm_state_id_t;
  auto on_event_unknown(const etl::imessage& msg) -> etl::fsm_state_id_t;
};

/// 状态：Running — 任务正在执行
struct StateRunning
    : public etl::fsm_state<etl::fsm, StateRunning, TaskStatusId::kRunning,
                            MsgYield, MsgBlock, MsgExit> {
  auto on_event(const MsgYield& msg) -> etl::fsm_state_id_t;
  auto on_event(const MsgBlock& msg) -> etl::fsm_state_id_t;
  auto on_event(const MsgExit& msg) -> etl::fsm_state_id_t;
  auto on_event_unknown(const etl::imessage& msg) -> etl::fsm_state_id_t;
};

/// 状态：Blocked — 任务阻塞，等待 WakeHandle 完成
struct StateBlocked : public etl::fsm_state<etl::fsm, StateBlocked,
                                            TaskStatusId::kBlocked, MsgWakeup> {
  auto on_event(const MsgWakeup& msg) -> etl::fsm_state_id_t;
  auto on_event_unknown(const etl::imessage& msg) -> etl::fsm_state_id_t;
};

/// 状态：Exited — 任务已退出
struct StateExited : public etl::fsm_state<etl::fsm, StateExited,
                                           TaskStatusId::kExited, MsgExit> {
  auto on_event(const MsgExit& msg) -> etl::fsm_state_id_t;
  auto on_event_unknown(const etl::imessage& msg) -> etl::fsm_state_id_t;
};

class TaskFsm {
 public:
  TaskFsm();

  /// 启动 FSM（在 TCB 完全构造后调用）
  void Start() { fsm_.start(); }

  /// 向 FSM 发送消息
  void Receive(const etl::imessage& msg) { fsm_.receive(msg); }

  /// 获取当前状态 ID
  auto GetStateId() const -> etl::fsm_state_id_t { return fsm_.get_state_id(); }

  /// @name 构造/析构函数
  /// @{
  TaskFsm(const TaskFsm&) = delete;
  TaskFsm(TaskFsm&&) = delete;
  auto operator=(const TaskFsm&) -> TaskFsm& = delete;
  auto operator=(TaskFsm&&) -> TaskFsm& = delete;
  ~TaskFsm() = default;
  /// @}

 private:
  StateUnInit state_uninit_;
  StateReady state_ready_;
  StateRunning state_running_;
  StateBlocked state_blocked_;
  StateExited state_exited_;

  etl::ifsm_state* state_list_[TaskStatusId::kTaskStatusCount];

  etl::fsm fsm_;
};

#endif  // FINITERESOURCE_SRC_TASK_INCLUDE_TASK_FSM_HPP_
