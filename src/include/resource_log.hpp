/**
 * @copyright Copyright The FiniteResource Contributors
 * @brief 日志相关函数
 */

#ifndef FINITERESOURCE_SRC_INCLUDE_RESOURCE_LOG_HPP_
#define FINITERESOURCE_SRC_INCLUDE_RESOURCE_LOG_HPP_

#include <array>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <source_location>
#include <utility>

#include "config.h"

namespace rlog {
namespace detail {

// 日志专用锁
inline std::mutex log_lock;

/// ANSI 转义码，在支持 ANSI 转义码的终端中可以显示颜色
static constexpr const auto kReset = "\033[0m";
static constexpr const auto kRed = "\033[31m";
static constexpr const auto kYellow = "\033[33m";
static constexpr const auto kMagenta = "\033[35m";
static constexpr const auto kCyan = "\033[36m";

enum LogLevel {
  kDebug,
  kInfo,
  kWarn,
  kErr,
  kLogLevelMax,
};

constexpr std::array<const char*, kLogLevelMax> kLogColors = {
    // kDebug
    detail::kMagenta,
    // kInfo
    detail::kCyan,
    // kWarn
    detail::kYellow,
    // kErr
    detail::kRed,
};

constexpr std::array<const char*, kLogLevelMax> kLogTags = {
    "D",
    "I",
    "W",
    "E",
};

template <LogLevel Level, typename... Args>
struct LogBase {
  explicit LogBase(Args&&... args,
                   [[maybe_unused]] const std::source_location& location =
                       std::source_location::current()) {
    if constexpr (Level == kDebug && !kFiniteResourceDebugLog) {
      return;
    }
    constexpr auto* color = kLogColors[Level];
    std::lock_guard<std::mutex> lock_guard(log_lock);
    std::fprintf(stderr, "%s[%s]", color, kLogTags[Level]);
    if constexpr (Level == kDebug) {
      std::fprintf(stderr, "[%s] ", location.function_name());
    }
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-security"
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
    std::fprintf(stderr, args...);
#pragma GCC diagnostic pop
    std::fprintf(stderr, "%s", detail::kReset);
  }
};

}  // namespace detail

template <typename... Args>
struct Debug : public detail::LogBase<detail::kDebug, Args...> {
  explicit Debug(Args&&... args, const std::source_location& location =
                                     std::source_location::current())
      : detail::LogBase<detail::kDebug, Args...>(std::forward<Args>(args)...,
                                                 location) {}
};
template <typename... Args>
Debug(Args&&...) -> Debug<Args...>;

template <typename... Args>
struct Info : public detail::LogBase<detail::kInfo, Args...> {
  explicit Info(Args&&... args, const std::source_location& location =
                                    std::source_location::current())
      : detail::LogBase<detail::kInfo, Args...>(std::forward<Args>(args)...,
                                                location) {}
};
template <typename... Args>
Info(Args&&...) -> Info<Args...>;

template <typename... Args>
struct Warn : public detail::LogBase<detail::kWarn, Args...> {
  explicit Warn(Args&&... args, const std::source_location& location =
                                    std::source_location::current())
      : detail::LogBase<detail::kWarn, Args...>(std::forward<Args>(args)...,
                                                location) {}
};
template <typename... Args>
Warn(Args&&...) -> Warn<Args...>;

template <typename... Args>
struct Err : public detail::LogBase<detail::kErr, Args...> {
  explicit Err(Args&&... args, const std::source_location& location =
                                   std::source_location::current())
      : detail::LogBase<detail::kErr, Args...>(std::forward<Args>(args)...,
                                               location) {}
};
template <typename... Args>
Err(Args&&...) -> Err<Args...>;

}  // namespace rlog

#endif /* FINITERESOURCE_SRC_INCLUDE_RESOURCE_LOG_HPP_ */
