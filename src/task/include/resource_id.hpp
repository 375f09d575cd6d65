/**
 * @copyright Copyright The FiniteResource Contributors
 */

#ifndef FINITERESOURCE_SRC_TASK_INCLUDE_RESOURCE_ID_HPP_
#define FINITERESOURCE_SRC_TASK_INCLUDE_RESOURCE_ID_HPP_

#include <cstdint>

/**
 * @brief 资源类型枚举
 */
enum class ResourceType : uint8_t {
  // 无效资源
  kNone = 0x00,
  // 资源池
  kResourcePool = 0x01,
  // 有界资源池
  kBoundedResourcePool = 0x02,
  // 直接等待 WakeHandle
  kWakeHandle = 0x03,
  kResourceTypeCount,
};

/**
 * @brief 获取资源类型的字符串表示（用于调试）
 * @param type 资源类型
 * @return 类型名称字符串
 */
constexpr const char* GetResourceTypeName(ResourceType type) {
  switch (type) {
    case ResourceType::kNone:
      return "None";
    case ResourceType::kResourcePool:
      return "ResourcePool";
    case ResourceType::kBoundedResourcePool:
      return "BoundedResourcePool";
    case ResourceType::kWakeHandle:
      return "WakeHandle";
    default:
      return "Unknown";
  }
}

/**
 * @brief 资源 ID，记录任务阻塞在哪个对象上
 *
 * [63:56] - 资源类型 (8 bits)
 * [55:0]  - 资源数据 (56 bits)
 */
struct ResourceId {
  /// 获取资源类型
  constexpr ResourceType GetType() const {
    return static_cast<ResourceType>((value_ >> kTypeShift) & 0xFF);
  }

  /// 获取资源数据
  constexpr uint64_t GetData() const { return value_ & kDataMask; }

  /// 获取类型名称（用于调试）
  constexpr const char* GetTypeName() const {
    return GetResourceTypeName(GetType());
  }

  /// 检查是否为无效资源
  constexpr explicit operator bool() const {
    return GetType() != ResourceType::kNone;
  }

  constexpr bool operator==(const ResourceId& other) const {
    return value_ == other.value_;
  }

  constexpr bool operator!=(const ResourceId& other) const {
    return value_ != other.value_;
  }

  /**
   * @brief 构造资源 ID
   * @param type 资源类型
   * @param data 资源数据 (如对象地址)
   */
  constexpr ResourceId(ResourceType type, uint64_t data)
      : value_((static_cast<uint64_t>(type) << kTypeShift) |
               (data & kDataMask)) {}

  /// @name 构造/析构函数
  /// @{
  ResourceId() = default;
  ResourceId(const ResourceId&) = default;
  ResourceId(ResourceId&&) = default;
  auto operator=(const ResourceId&) -> ResourceId& = default;
  auto operator=(ResourceId&&) -> ResourceId& = default;
  ~ResourceId() = default;
  /// @}

 private:
  static constexpr uint8_t kTypeShift = 56;
  static constexpr uint64_t kDataMask = 0x00FFFFFFFFFFFFFFULL;

  uint64_t value_{0};
};

#endif /* FINITERESOURCE_SRC_TASK_INCLUDE_RESOURCE_ID_HPP_ */
