/**
 * @copyright Copyright The FiniteResource Contributors
 */

#ifndef FINITERESOURCE_SRC_TASK_INCLUDE_TASK_MESSAGES_HPP_
#define FINITERESOURCE_SRC_TASK_INCLUDE_TASK_MESSAGES_HPP_

#include <etl/message.h>

#include "resource_id.hpp"

/// Task FSM 消息 ID
namespace task_msg_id {
static constexpr etl::message_id_t kSchedule = 1;
static constexpr etl::message_id_t kYield = 2;
static constexpr etl::message_id_t kBlock = 3;
static constexpr etl::message_id_t kWakeup = 4;
static constexpr etl::message_id_t kExit = 5;
}  // namespace task_msg_id

/// 消息路由 ID
namespace router_id {
static constexpr etl::message_router_id_t kTaskFsm = 1;
}  // namespace router_id

/// Task FSM 消息结构体（无负载，用作事件）
struct MsgSchedule : public etl::message<task_msg_id::kSchedule> {};
struct MsgYield : public etl::message<task_msg_id::kYield> {};
struct MsgWakeup : public etl::message<task_msg_id::kWakeup> {};

/// 阻塞消息，携带资源 ID
struct MsgBlock : public etl::message<task_msg_id::kBlock> {
  ResourceId resource_id;
  explicit MsgBlock(ResourceId id) : resource_id(id) {}
};

/// 退出消息，携带退出码
struct MsgExit : public etl::message<task_msg_id::kExit> {
  int exit_code;
  explicit MsgExit(int code) : exit_code(code) {}
};

#endif  // FINITERESOURCE_SRC_TASK_INCLUDE_TASK_MESSAGES_HPP_
