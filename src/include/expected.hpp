/**
 * @copyright Copyright The FiniteResource Contributors
 */

#ifndef FINITERESOURCE_SRC_INCLUDE_EXPECTED_HPP_
#define FINITERESOURCE_SRC_INCLUDE_EXPECTED_HPP_

#include <cstdint>
#include <expected>

/// 错误码
enum class ErrorCode : uint64_t {
  kSuccess = 0,
  // 任务调度相关错误 (0x100 - 0x1FF)
  kTaskNoContext = 0x100,
  kTaskCancelled = 0x101,
  kTaskTableFull = 0x102,
  kTaskReadyQueueFull = 0x103,
  kTaskSwitchFailed = 0x104,
  kTaskAlreadyExited = 0x105,
  // 资源池相关错误 (0x200 - 0x2FF)
  kResourceNegativeValue = 0x200,
  kResourceNegativeBound = 0x201,
  kResourceNonPositiveAmount = 0x202,
  kResourceOverRelease = 0x203,
  kResourcePrecisionFault = 0x204,
  kResourceWaitQueueFull = 0x205,
  // ScopedAcquisition 相关错误 (0x300 - 0x3FF)
  kScopeAlreadyConsumed = 0x300,
  kScopeNotEntered = 0x301,
  kScopeAlreadyEntered = 0x302,
  // 通用错误 (0xF00 - 0xFFF)
  kInvalidArgument = 0xF00,
  kOutOfMemory = 0xF01,
};

/// 获取错误码对应的错误信息
constexpr auto GetErrorMessage(ErrorCode code) -> const char* {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kTaskNoContext:
      return "Not running in task context";
    case ErrorCode::kTaskCancelled:
      return "Task cancelled";
    case ErrorCode::kTaskTableFull:
      return "Task table full";
    case ErrorCode::kTaskReadyQueueFull:
      return "Ready queue full";
    case ErrorCode::kTaskSwitchFailed:
      return "Context switch failed";
    case ErrorCode::kTaskAlreadyExited:
      return "Task already exited";
    case ErrorCode::kResourceNegativeValue:
      return "Initial value must be >= 0";
    case ErrorCode::kResourceNegativeBound:
      return "Bound value must be >= 0";
    case ErrorCode::kResourceNonPositiveAmount:
      return "Amount must be > 0";
    case ErrorCode::kResourceOverRelease:
      return "Released too many times";
    case ErrorCode::kResourcePrecisionFault:
      return "Bound arithmetic imprecision, use an exact amount type";
    case ErrorCode::kResourceWaitQueueFull:
      return "Resource wait queue full";
    case ErrorCode::kScopeAlreadyConsumed:
      return "Scoped acquisition already consumed";
    case ErrorCode::kScopeNotEntered:
      return "Scoped acquisition not entered";
    case ErrorCode::kScopeAlreadyEntered:
      return "Scoped acquisition already entered";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kOutOfMemory:
      return "Out of memory";
    default:
      return "Unknown error";
  }
}

/// 错误类型，用于 std::expected
struct Error {
  ErrorCode code;

  constexpr Error(ErrorCode c) : code(c) {}

  [[nodiscard]] constexpr auto message() const -> const char* {
    return GetErrorMessage(code);
  }
};

/// std::expected 别名模板
template <typename T>
using Expected = std::expected<T, Error>;

#endif /* FINITERESOURCE_SRC_INCLUDE_EXPECTED_HPP_ */
