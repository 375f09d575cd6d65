/** @copyright Copyright The FiniteResource Contributors */

#ifndef FINITERESOURCE_SRC_INCLUDE_RESOURCE_CONFIG_HPP_
#define FINITERESOURCE_SRC_INCLUDE_RESOURCE_CONFIG_HPP_

#include <cstddef>

#include "config.h"

namespace resource::config {

// ── 任务管理容量 ────────────────────────────────────────────────
/// 最大任务数（task_table_ 容量）
inline constexpr size_t kMaxTasks = 128;
/// task_table_ 桶数（建议 = 2 × kMaxTasks）
inline constexpr size_t kMaxTasksBuckets = 256;

/// 调度器就绪队列容量
inline constexpr size_t kMaxReadyTasks = 128;
// 任务变为就绪时入队不能失败，否则已授予的任务将无法再被调度
static_assert(kMaxReadyTasks >= kMaxTasks,
              "ready queue must be able to hold every task");

/// 任务栈大小（由 cmake 配置）
inline constexpr size_t kTaskStackSize = kFiniteResourceTaskStackSize;

// ── 资源池容量 ──────────────────────────────────────────────────
/// 每个资源池的最大等待者数量（waiters_ 容量）
inline constexpr size_t kMaxPoolWaiters = 64;

/// RunUntilIdle 的最大调度轮数，防止互相 Yield 的任务导致死循环
inline constexpr size_t kMaxIdlePasses = 4096;

}  // namespace resource::config

#endif  // FINITERESOURCE_SRC_INCLUDE_RESOURCE_CONFIG_HPP_
