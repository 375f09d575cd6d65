/**
 * @copyright Copyright The FiniteResource Contributors
 * @brief Task FSM implementation — etl::fsm state transition bodies
 */

#include "task_fsm.hpp"

#include "resource_log.hpp"

// ─── StateUnInit ─────────────────────────────────────────────────────────────

auto StateUnInit::on_event(const MsgSchedule& /*msg*/) -> etl::fsm_state_id_t {
  return TaskStatusId::kReady;
}

auto StateUnInit::on_event_unknown(const etl::imessage& msg)
    -> etl::fsm_state_id_t {
  rlog::Warn("TaskFsm: UnInit received unexpected message id=%d\n",
             static_cast<int>(msg.get_message_id()));
  return STATE_ID;
}

// ─── StateReady ──────────────────────────────────────────────────────────────

auto StateReady::on_event(const MsgSchedule& /*msg*/) -> etl::fsm_state_id_t {
  return TaskStatusId::kRunning;
}

auto StateReady::on_event_unknown(const etl::imessage& msg)
    -> etl::fsm_state_id_t {
  rlog::Warn("TaskFsm: Ready received unexpected message id=%d\n",
             static_cast<int>(msg.get_message_id()));
  return STATE_ID;
}

// ─── StateRunning ────────────────────────────────────────────────────────────

auto StateRunning::on_event(const MsgYield& /*msg*/) -> etl::fsm_state_id_t {
  return TaskStatusId::kReady;
}

auto StateRunning::on_event(const MsgBlock& /*msg*/) -> etl::fsm_state_id_t {
  return TaskStatusId::kBlocked;
}

auto StateRunning::on_event(const MsgExit& /*msg*/) -> etl::fsm_state_id_t {
  return TaskStatusId::kExited;
}

auto StateRunning::on_event_unknown(const etl::imessage& msg)
    -> etl::fsm_state_id_t {
  rlog::Warn("TaskFsm: Running received unexpected message id=%d\n",
             static_cast<int>(msg.get_message_id()));
  return STATE_ID;
}

// ─── StateBlocked ────────────────────────────────────────────────────────────

auto StateBlocked::on_event(const MsgWakeup& /*msg*/) -> etl::fsm_state_id_t {
  return TaskStatusId::kReady;
}

auto StateBlocked::on_event_unknown(const etl::imessage& msg)
    -> etl::fsm_state_id_t {
  rlog::Warn("TaskFsm: Blocked received unexpected message id=%d\n",
             static_cast<int>(msg.get_message_id()));
  return STATE_ID;
}

// ─── StateExited ─────────────────────────────────────────────────────────────

auto StateExited::on_event(const MsgExit& /*msg*/) -> etl::fsm_state_id_t {
  return STATE_ID;
}

auto StateExited::on_event_unknown(const etl::imessage& msg)
    -> etl::fsm_state_id_t {
  rlog::Warn("TaskFsm: Exited received unexpected message id=%d\n",
             static_cast<int>(msg.get_message_id()));
  return STATE_ID;
}

// ─── TaskFsm ─────────────────────────────────────────────────────────────────

TaskFsm::TaskFsm() : fsm_(router_id::kTaskFsm) {
  state_list_[TaskStatusId::kUnInit] = &state_uninit_;
  state_list_[TaskStatusId::kReady] = &state_ready_;
  state_list_[TaskStatusId::kRunning] = &state_running_;
  state_list_[TaskStatusId::kBlocked] = &state_blocked_;
  state_list_[TaskStatusId::kExited] = &state_exited_;
  fsm_.set_states(state_list_, TaskStatusId::kTaskStatusCount);
}
