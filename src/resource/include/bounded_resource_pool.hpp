/**
 * @copyright Copyright The FiniteResource Contributors
 */

#ifndef FINITERESOURCE_SRC_RESOURCE_INCLUDE_BOUNDED_RESOURCE_POOL_HPP_
#define FINITERESOURCE_SRC_RESOURCE_INCLUDE_BOUNDED_RESOURCE_POOL_HPP_

#include <algorithm>
#include <memory>
#include <new>
#include <variant>

#include "expected.hpp"
#include "resource_amount.hpp"
#include "resource_id.hpp"
#include "resource_log.hpp"
#include "resource_pool.hpp"

namespace resource {

/**
 * @brief 有上限的资源池
 *
 * 在 ResourcePool 的基础上：
 * - value 不会超过 bound，超额归还返回 kResourceOverRelease
 * - bound 可以在租约未归还时调整，无法立即收回的部分记为待收缩量，
 *   由之后的 Release 逐步吸收
 *
 * @note 待收缩量不区分归还者：没有租约的调用方先调用 Release 会吸收待收缩量，
 * 超额归还错误会延迟到之后真正持有租约的任务归还时才出现
 */
template <ResourceAmount T>
class BoundedResourcePool : public ResourcePool<T> {
 public:
  /**
   * @brief UpdateBoundValue 的结果
   */
  struct BoundUpdate {
    /// 新上限是否已完全生效
    bool fully_applied;
    /// 留待 Release 吸收的数量
    T remaining_deferred;
  };

  /**
   * @brief 创建有界资源池，上限等于初始数量
   * @param initial_value 初始数量
   * @param name 名称
   * @return Expected<std::unique_ptr<BoundedResourcePool>>
   */
  static auto Create(T initial_value, const char* name = "unnamed_bounded_pool")
      -> Expected<std::unique_ptr<BoundedResourcePool>> {
    return Create(initial_value, initial_value, name);
  }

  /**
   * @brief 创建有界资源池
   * @param initial_value 初始数量
   * @param bound 上限
   * @param name 名称
   * @return Expected<std::unique_ptr<BoundedResourcePool>>
   * initial_value < 0 返回 kResourceNegativeValue，bound < 0 返回
   * kResourceNegativeBound，initial_value > bound 返回 kInvalidArgument
   */
  static auto Create(T initial_value, T bound, const char* name)
      -> Expected<std::unique_ptr<BoundedResourcePool>> {
    if (initial_value < T{}) {
      rlog::Err("BoundedResourcePool::Create: '%s' initial value %g < 0\n",
                name, static_cast<double>(initial_value));
      return std::unexpected(Error(ErrorCode::kResourceNegativeValue));
    }
    if (bound < T{}) {
      rlog::Err("BoundedResourcePool::Create: '%s' bound %g < 0\n", name,
                static_cast<double>(bound));
      return std::unexpected(Error(ErrorCode::kResourceNegativeBound));
    }
    if (initial_value > bound) {
      rlog::Err("BoundedResourcePool::Create: '%s' initial value %g > bound %g\n",
                name, static_cast<double>(initial_value),
                static_cast<double>(bound));
      return std::unexpected(Error(ErrorCode::kInvalidArgument));
    }

    std::unique_ptr<BoundedResourcePool> pool(
        new (std::nothrow) BoundedResourcePool(initial_value, bound, name));
    if (pool == nullptr) {
      return std::unexpected(Error(ErrorCode::kOutOfMemory));
    }
    return pool;
  }

  /**
   * @brief 归还资源
   *
   * 存在待收缩量时先从本次归还中吸收，再检查上限。
   *
   * @param amount 归还数量，必须 > 0
   * @return Expected<void> value 已达到 bound 时返回 kResourceOverRelease
   */
  auto Release(T amount) -> Expected<void> override {
    if (!(amount > T{})) {
      rlog::Err("BoundedResourcePool::Release: '%s' amount %g <= 0\n",
                this->name_, static_cast<double>(amount));
      return std::unexpected(Error(ErrorCode::kResourceNonPositiveAmount));
    }

    if (auto* pending = std::get_if<PendingShrink>(&shrink_)) {
      T absorbed = std::min(amount, pending->amount);
      this->value_ -= absorbed;
      pending->amount -= absorbed;
      rlog::Debug(
          "BoundedResourcePool::Release: '%s' absorbed %g, pending=%g\n",
          this->name_, static_cast<double>(absorbed),
          static_cast<double>(pending->amount));
      if (!(pending->amount > T{})) {
        shrink_ = Stable{};
      }
    }

    if (this->value_ >= bound_) {
      rlog::Err("BoundedResourcePool::Release: '%s' released too many times\n",
                this->name_);
      return std::unexpected(Error(ErrorCode::kResourceOverRelease));
    }

    this->value_ += amount;
    this->WakeUpNext();
    return {};
  }

  /**
   * @brief 调整上限
   *
   * - 相等：清除待收缩量
   * - 增大：value 增加差值并唤醒等待者
   * - 减小：立即收回空闲部分，其余记为待收缩量
   *
   * @param new_bound 新上限
   * @return Expected<BoundUpdate> new_bound < 0 返回 kResourceNegativeBound；
   * 减法结果不一致（浮点误差）返回 kResourcePrecisionFault
   */
  auto UpdateBoundValue(T new_bound) -> Expected<BoundUpdate> {
    if (new_bound < T{}) {
      rlog::Err("BoundedResourcePool::UpdateBoundValue: '%s' bound %g < 0\n",
                this->name_, static_cast<double>(new_bound));
      return std::unexpected(Error(ErrorCode::kResourceNegativeBound));
    }

    if (new_bound == bound_) {
      shrink_ = Stable{};
      return BoundUpdate{true, T{}};
    }

    if (new_bound > bound_) {
      T diff = new_bound - bound_;
      bound_ = new_bound;
      this->value_ += diff;
      shrink_ = Stable{};
      rlog::Debug(
          "BoundedResourcePool::UpdateBoundValue: '%s' bound=%g value=%g\n",
          this->name_, static_cast<double>(bound_),
          static_cast<double>(this->value_));
      this->WakeUpWaiters();
      return BoundUpdate{true, T{}};
    }

    T leased = bound_ - this->value_;
    T want = bound_ - new_bound;
    // value 不会小于 0，leased 只有在非法归还后才可能超过 bound
    T idle = bound_ - leased;
    T reclaimable = std::max(T{}, idle);
    if (reclaimable > T{}) {
      T taken = std::min(want, reclaimable);
      this->value_ -= taken;
      want -= taken;
    }
    bound_ = new_bound;

    if (want == T{}) {
      shrink_ = Stable{};
      return BoundUpdate{true, T{}};
    }
    if (want > T{}) {
      shrink_ = PendingShrink{want};
      rlog::Debug(
          "BoundedResourcePool::UpdateBoundValue: '%s' bound=%g deferred=%g\n",
          this->name_, static_cast<double>(bound_), static_cast<double>(want));
      return BoundUpdate{false, want};
    }

    rlog::Err(
        "BoundedResourcePool::UpdateBoundValue: '%s' imprecise arithmetic, "
        "remaining=%g\n",
        this->name_, static_cast<double>(want));
    return std::unexpected(Error(ErrorCode::kResourcePrecisionFault));
  }

  void Dump() const override {
    char state[ResourcePool<T>::kStateBufferSize];
    this->FormatState(state, sizeof(state));
    rlog::Info("BoundedResourcePool '%s' [%s, bound:%g, pending:%g]\n",
               this->name_, state, static_cast<double>(bound_),
               static_cast<double>(GetPendingDecrement()));
  }

  auto GetBound() const -> T { return bound_; }

  auto IsShrinkPending() const -> bool {
    return std::holds_alternative<PendingShrink>(shrink_);
  }

  /// 待收缩量，没有时为 0
  auto GetPendingDecrement() const -> T {
    if (const auto* pending = std::get_if<PendingShrink>(&shrink_)) {
      return pending->amount;
    }
    return T{};
  }

  /// @name 构造/析构函数
  /// @{
  BoundedResourcePool(const BoundedResourcePool&) = delete;
  BoundedResourcePool(BoundedResourcePool&&) = delete;
  auto operator=(const BoundedResourcePool&) -> BoundedResourcePool& = delete;
  auto operator=(BoundedResourcePool&&) -> BoundedResourcePool& = delete;
  ~BoundedResourcePool() override = default;
  /// @}

 private:
  /// 没有待收缩量
  struct Stable {};
  /// 等待 Release 吸收的收缩量
  struct PendingShrink {
    T amount;
  };

  BoundedResourcePool(T initial_value, T bound, const char* name)
      : ResourcePool<T>(initial_value, name,
                        ResourceType::kBoundedResourcePool),
        bound_(bound) {}

  /// 上限
  T bound_;
  /// 收缩状态
  std::variant<Stable, PendingShrink> shrink_{Stable{}};
};

}  // namespace resource

#endif /* FINITERESOURCE_SRC_RESOURCE_INCLUDE_BOUNDED_RESOURCE_POOL_HPP_ */
