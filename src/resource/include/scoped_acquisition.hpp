/**
 * @copyright Copyright The FiniteResource Contributors
 */

#ifndef FINITERESOURCE_SRC_RESOURCE_INCLUDE_SCOPED_ACQUISITION_HPP_
#define FINITERESOURCE_SRC_RESOURCE_INCLUDE_SCOPED_ACQUISITION_HPP_

#include <cstdint>

#include "expected.hpp"
#include "resource_amount.hpp"
#include "resource_log.hpp"

namespace resource {

template <ResourceAmount T>
class ResourcePool;

/**
 * @brief 作用域内的一次性资源租用
 *
 * 状态只前进不后退：kIdle -> kEntered -> kConsumed
 * - Enter 申请 amount，可能挂起当前任务
 * - Exit 归还 amount，恰好一次
 * - 析构时仍处于 kEntered 则自动归还，保证提前返回或取消时也会释放
 *
 * @note 不可复用：Exit 之后再次 Enter 返回 kScopeAlreadyConsumed
 */
template <ResourceAmount T>
class ScopedAcquisition {
 public:
  enum class State : uint8_t {
    // 尚未申请
    kIdle,
    // 已申请，持有租约
    kEntered,
    // 已归还或申请失败
    kConsumed,
  };

  /**
   * @brief 构造函数
   * @param pool 资源池
   * @param amount 租用数量
   */
  ScopedAcquisition(ResourcePool<T>& pool, T amount)
      : pool_(pool), amount_(amount) {}

  /**
   * @brief 申请资源
   * @return Expected<void> 申请失败（如任务被取消）时令牌作废且不归还；
   * 已持有时返回 kScopeAlreadyEntered，已使用过时返回 kScopeAlreadyConsumed
   */
  auto Enter() -> Expected<void> {
    if (state_ == State::kEntered) {
      rlog::Warn("ScopedAcquisition::Enter: pool '%s' scope already entered\n",
                 pool_.GetName());
      return std::unexpected(Error(ErrorCode::kScopeAlreadyEntered));
    }
    if (state_ == State::kConsumed) {
      rlog::Warn("ScopedAcquisition::Enter: pool '%s' scope already used\n",
                 pool_.GetName());
      return std::unexpected(Error(ErrorCode::kScopeAlreadyConsumed));
    }

    auto result = pool_.Acquire(amount_);
    if (!result) {
      state_ = State::kConsumed;
      return result;
    }

    state_ = State::kEntered;
    return {};
  }

  /**
   * @brief 归还资源
   * @return Expected<void> 透传资源池 Release 的错误（如有界池超额归还）
   */
  auto Exit() -> Expected<void> {
    if (state_ == State::kIdle) {
      return std::unexpected(Error(ErrorCode::kScopeNotEntered));
    }
    if (state_ == State::kConsumed) {
      return std::unexpected(Error(ErrorCode::kScopeAlreadyConsumed));
    }

    state_ = State::kConsumed;
    return pool_.Release(amount_);
  }

  auto GetState() const -> State { return state_; }
  auto GetAmount() const -> T { return amount_; }

  /// @name 构造/析构函数
  /// @{
  ScopedAcquisition(const ScopedAcquisition&) = delete;
  ScopedAcquisition(ScopedAcquisition&&) = delete;
  auto operator=(const ScopedAcquisition&) -> ScopedAcquisition& = delete;
  auto operator=(ScopedAcquisition&&) -> ScopedAcquisition& = delete;
  ~ScopedAcquisition() {
    if (state_ != State::kEntered) {
      return;
    }
    auto result = Exit();
    if (!result) {
      rlog::Err("ScopedAcquisition: release %g to pool '%s' failed: %s\n",
                static_cast<double>(amount_), pool_.GetName(),
                result.error().message());
    }
  }
  /// @}

 private:
  ResourcePool<T>& pool_;
  T amount_;
  State state_{State::kIdle};
};

}  // namespace resource

#endif /* FINITERESOURCE_SRC_RESOURCE_INCLUDE_SCOPED_ACQUISITION_HPP_ */
