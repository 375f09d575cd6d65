/**
 * @copyright Copyright The FiniteResource Contributors
 */

#ifndef FINITERESOURCE_SRC_RESOURCE_INCLUDE_RESOURCE_POOL_HPP_
#define FINITERESOURCE_SRC_RESOURCE_INCLUDE_RESOURCE_POOL_HPP_

#include <etl/list.h>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <new>

#include "expected.hpp"
#include "resource_amount.hpp"
#include "resource_config.hpp"
#include "resource_id.hpp"
#include "resource_log.hpp"
#include "scoped_acquisition.hpp"
#include "task_manager.hpp"
#include "wake_handle.hpp"

namespace resource {

/**
 * @brief 按数量租用的资源池（加权信号量）
 *
 * 池中保存一个数值 value，任务可以申请和归还任意正数量：
 * - value 足够时 Acquire 立即成功，不考虑已排队的等待者
 * - value 不足时当前任务排到等待队列尾部并挂起
 * - 唤醒总是从队首开始，选择第一个未完成且数量 <= value 的等待者
 *
 * @note 使用限制：
 * 1. 单线程协作式调度：挂起点之间不会被打断，内部不加锁
 * 2. 阻塞的 Acquire 必须在任务上下文中调用
 * 3. Release 不检查调用方是否持有租约
 */
template <ResourceAmount T>
class ResourcePool {
 public:
  /**
   * @brief 创建资源池
   * @param initial_value 初始数量
   * @param name 名称
   * @return Expected<std::unique_ptr<ResourcePool>> initial_value < 0 时返回
   * kResourceNegativeValue
   */
  static auto Create(T initial_value, const char* name = "unnamed_pool")
      -> Expected<std::unique_ptr<ResourcePool>> {
    if (initial_value < T{}) {
      rlog::Err("ResourcePool::Create: '%s' initial value %g < 0\n", name,
                static_cast<double>(initial_value));
      return std::unexpected(Error(ErrorCode::kResourceNegativeValue));
    }

    std::unique_ptr<ResourcePool> pool(new (std::nothrow) ResourcePool(
        initial_value, name, ResourceType::kResourcePool));
    if (pool == nullptr) {
      return std::unexpected(Error(ErrorCode::kOutOfMemory));
    }
    return pool;
  }

  /**
   * @brief 申请资源
   *
   * value >= amount 时立即扣减并返回，否则挂起当前任务直到被授予或取消。
   * 被取消时如果已被授予，将 amount 归还后再尝试唤醒其他等待者。
   *
   * @param amount 申请数量，必须 > 0
   * @return Expected<void> 成功；取消时返回 kTaskCancelled
   */
  auto Acquire(T amount) -> Expected<void> {
    if (!(amount > T{})) {
      rlog::Err("ResourcePool::Acquire: '%s' amount %g <= 0\n", name_,
                static_cast<double>(amount));
      return std::unexpected(Error(ErrorCode::kResourceNonPositiveAmount));
    }

    // 快速路径
    if (value_ >= amount) {
      value_ -= amount;
      rlog::Debug("ResourcePool::Acquire: '%s' took %g, value=%g\n", name_,
                  static_cast<double>(amount), static_cast<double>(value_));
      return {};
    }

    auto& task_manager = TaskManagerSingleton::instance();
    auto* current_task = task_manager.GetCurrentTask();
    if (current_task == nullptr) {
      rlog::Err(
          "ResourcePool::Acquire: Cannot wait on pool '%s' outside task "
          "context\n",
          name_);
      return std::unexpected(Error(ErrorCode::kTaskNoContext));
    }

    if (waiters_.full()) {
      rlog::Err("ResourcePool::Acquire: '%s' wait queue full\n", name_);
      return std::unexpected(Error(ErrorCode::kResourceWaitQueueFull));
    }

    // 等待记录位于当前任务栈上，挂起期间保持有效
    Waiter waiter(amount);
    Expected<void> wait_result;
    {
      WaiterRegistration registration(waiters_, waiter);
      rlog::Debug("ResourcePool::Acquire: Task %zu waits for %g on '%s'\n",
                  current_task->pid, static_cast<double>(amount), name_);
      wait_result = task_manager.Block(waiter.handle, resource_id_);
    }

    if (!wait_result) {
      // 授予与取消竞争：value 已被唤醒方扣减，需要归还
      if (waiter.handle.IsGranted()) {
        value_ += amount;
        rlog::Debug(
            "ResourcePool::Acquire: Task %zu cancelled after grant, "
            "return %g to '%s'\n",
            current_task->pid, static_cast<double>(amount), name_);
      }
      WakeUpWaiters();
      return wait_result;
    }

    // 排队期间可能有新的等待者到达，尽可能多地唤醒
    WakeUpWaiters();
    rlog::Debug("ResourcePool::Acquire: Task %zu acquired %g from '%s'\n",
                current_task->pid, static_cast<double>(amount), name_);
    return {};
  }

  /**
   * @brief 归还资源，不会挂起
   *
   * value += amount，然后最多唤醒一个等待者。
   *
   * @param amount 归还数量，必须 > 0
   * @return Expected<void> 成功
   */
  virtual auto Release(T amount) -> Expected<void> {
    if (!(amount > T{})) {
      rlog::Err("ResourcePool::Release: '%s' amount %g <= 0\n", name_,
                static_cast<double>(amount));
      return std::unexpected(Error(ErrorCode::kResourceNonPositiveAmount));
    }

    value_ += amount;
    WakeUpNext();
    return {};
  }

  /**
   * @brief 资源是否无法立即获取
   * @return true value 为 0，或有未取消的等待者可以被满足
   */
  auto Locked() const -> bool { return value_ == T{} || HasEligibleWaiter(); }

  /**
   * @brief 申请 amount 是否无法立即获取
   * @param amount 申请数量
   * @return true value < amount，或有未取消的等待者可以被满足
   */
  auto LockedForValue(T amount) const -> bool {
    return value_ < amount || HasEligibleWaiter();
  }

  /**
   * @brief 创建作用域租用
   * @param amount 租用数量
   * @return ScopedAcquisition<T> 调用 Enter/Exit，或由析构自动归还
   */
  auto Use(T amount) -> ScopedAcquisition<T> {
    return ScopedAcquisition<T>(*this, amount);
  }

  /// 输出当前状态
  virtual void Dump() const {
    char state[kStateBufferSize];
    FormatState(state, sizeof(state));
    rlog::Info("ResourcePool '%s' [%s]\n", name_, state);
  }

  auto GetValue() const -> T { return value_; }
  auto GetWaiterCount() const -> size_t { return waiters_.size(); }
  auto GetName() const -> const char* { return name_; }
  auto GetResourceId() const -> ResourceId { return resource_id_; }

  /// @name 构造/析构函数
  /// @{
  ResourcePool(const ResourcePool&) = delete;
  ResourcePool(ResourcePool&&) = delete;
  auto operator=(const ResourcePool&) -> ResourcePool& = delete;
  auto operator=(ResourcePool&&) -> ResourcePool& = delete;
  virtual ~ResourcePool() = default;
  /// @}

 protected:
  /**
   * @brief 等待记录
   */
  struct Waiter {
    /// 申请数量
    T amount;
    /// 唤醒句柄
    WakeHandle handle;

    explicit Waiter(T amount) : amount(amount) {}
  };

  using WaiterList = etl::list<Waiter*, config::kMaxPoolWaiters>;

  /**
   * @brief 等待记录在队列中的登记，离开作用域时移出队列
   */
  class WaiterRegistration {
   public:
    WaiterRegistration(WaiterList& waiters, Waiter& waiter)
        : list_(waiters), waiter_(waiter) {
      list_.push_back(&waiter_);
    }

    /// @name 构造/析构函数
    /// @{
    WaiterRegistration(const WaiterRegistration&) = delete;
    WaiterRegistration(WaiterRegistration&&) = delete;
    auto operator=(const WaiterRegistration&) -> WaiterRegistration& = delete;
    auto operator=(WaiterRegistration&&) -> WaiterRegistration& = delete;
    ~WaiterRegistration() { list_.remove(&waiter_); }
    /// @}

   private:
    WaiterList& list_;
    Waiter& waiter_;
  };

  ResourcePool(T initial_value, const char* name, ResourceType type)
      : value_(initial_value),
        name_(name),
        resource_id_(type, reinterpret_cast<uint64_t>(this)) {}

  /**
   * @brief 唤醒队首起第一个未完成且可满足的等待者
   * @return true 唤醒了一个等待者
   */
  auto WakeUpNext() -> bool {
    auto& task_manager = TaskManagerSingleton::instance();
    for (auto* waiter : waiters_) {
      if (waiter->handle.IsDone() || value_ < waiter->amount) {
        continue;
      }
      if (!task_manager.Wakeup(waiter->handle)) {
        continue;
      }
      value_ -= waiter->amount;
      rlog::Debug("ResourcePool::WakeUpNext: '%s' granted %g, value=%g\n",
                  name_, static_cast<double>(waiter->amount),
                  static_cast<double>(value_));
      return true;
    }
    return false;
  }

  /// 只要 value > 0 就继续唤醒
  void WakeUpWaiters() {
    while (value_ > T{}) {
      if (!WakeUpNext()) {
        break;
      }
    }
  }

  /// 状态描述缓冲区大小
  static constexpr size_t kStateBufferSize = 128;

  /**
   * @brief 格式化状态描述：locked 或 unlocked, value:X，有等待者时追加 waiters:N
   * @param buffer 输出缓冲区
   * @param size 缓冲区大小
   */
  void FormatState(char* buffer, size_t size) const {
    int written = Locked() ? std::snprintf(buffer, size, "locked")
                           : std::snprintf(buffer, size, "unlocked, value:%g",
                                           static_cast<double>(value_));
    if (waiters_.empty() || written < 0 ||
        static_cast<size_t>(written) >= size) {
      return;
    }
    std::snprintf(buffer + written, size - written, ", waiters:%zu",
                  waiters_.size());
  }

  /// 当前可用数量
  T value_;
  /// 名称
  const char* name_;
  /// 资源 ID
  ResourceId resource_id_;
  /// 等待队列（先进先出）
  WaiterList waiters_;

 private:
  auto HasEligibleWaiter() const -> bool {
    for (const auto* waiter : waiters_) {
      if (value_ >= waiter->amount && !waiter->handle.IsCancelled()) {
        return true;
      }
    }
    return false;
  }
};

}  // namespace resource

#endif /* FINITERESOURCE_SRC_RESOURCE_INCLUDE_RESOURCE_POOL_HPP_ */
