/**
 * @copyright Copyright The FiniteResource Contributors
 */

#ifndef FINITERESOURCE_SRC_TASK_INCLUDE_WAKE_HANDLE_HPP_
#define FINITERESOURCE_SRC_TASK_INCLUDE_WAKE_HANDLE_HPP_

#include <cstdint>

struct TaskControlBlock;

/**
 * @brief 唤醒句柄状态
 */
enum class WakeState : uint8_t {
  // 等待中
  kPending,
  // 已授予
  kGranted,
  // 已取消
  kCancelled,
};

/**
 * @brief 唤醒句柄
 *
 * 阻塞任务等待的一次性完成标志：
 * - 只能从 kPending 转换一次，转换到 kGranted 或 kCancelled
 * - 由 TaskManager::Block 绑定等待任务
 * - 由 TaskManager::Wakeup 授予，由 TaskManager::Cancel 取消
 */
class WakeHandle {
 public:
  /**
   * @brief 授予
   * @return true  成功从 kPending 转换为 kGranted
   * @return false 句柄已完成
   */
  auto Complete() -> bool {
    if (state_ != WakeState::kPending) {
      return false;
    }
    state_ = WakeState::kGranted;
    return true;
  }

  /**
   * @brief 取消
   * @return true  成功从 kPending 转换为 kCancelled
   * @return false 句柄已完成
   */
  auto Cancel() -> bool {
    if (state_ != WakeState::kPending) {
      return false;
    }
    state_ = WakeState::kCancelled;
    return true;
  }

  auto GetState() const -> WakeState { return state_; }
  auto IsDone() const -> bool { return state_ != WakeState::kPending; }
  auto IsGranted() const -> bool { return state_ == WakeState::kGranted; }
  auto IsCancelled() const -> bool { return state_ == WakeState::kCancelled; }

  /// 等待此句柄的任务，未被等待时为 nullptr
  auto GetWaiter() const -> TaskControlBlock* { return waiter_; }
  void BindWaiter(TaskControlBlock* task) { waiter_ = task; }

  /// @name 构造/析构函数
  /// @{
  WakeHandle() = default;
  WakeHandle(const WakeHandle&) = delete;
  WakeHandle(WakeHandle&&) = delete;
  auto operator=(const WakeHandle&) -> WakeHandle& = delete;
  auto operator=(WakeHandle&&) -> WakeHandle& = delete;
  ~WakeHandle() = default;
  /// @}

 private:
  WakeState state_{WakeState::kPending};
  TaskControlBlock* waiter_{nullptr};
};

#endif /* FINITERESOURCE_SRC_TASK_INCLUDE_WAKE_HANDLE_HPP_ */
