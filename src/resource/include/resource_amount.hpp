/**
 * @copyright Copyright The FiniteResource Contributors
 */

#ifndef FINITERESOURCE_SRC_RESOURCE_INCLUDE_RESOURCE_AMOUNT_HPP_
#define FINITERESOURCE_SRC_RESOURCE_INCLUDE_RESOURCE_AMOUNT_HPP_

#include <concepts>

namespace resource {

/**
 * @brief 资源数量类型约束
 *
 * 资源池对数量类型的全部要求：
 * - 全序比较
 * - 值初始化 T{} 为零
 * - 加减运算及复合赋值
 * - 可显式转换为 double（仅用于日志）
 *
 * 内置整数、浮点数以及用户定义的定点数/高精度十进制类型均可满足。
 * 有界资源池的容量调整涉及减法链，建议使用精确类型：
 * 例如以整数表示定点单位，浮点数需由调用方自行承担舍入误差。
 */
template <typename T>
concept ResourceAmount = std::totally_ordered<T> && std::copyable<T> &&
                         std::default_initializable<T> &&
                         requires(T a, const T b) {
                           { a + b } -> std::convertible_to<T>;
                           { a - b } -> std::convertible_to<T>;
                           { a += b } -> std::same_as<T&>;
                           { a -= b } -> std::same_as<T&>;
                           static_cast<double>(b);
                         };

}  // namespace resource

#endif /* FINITERESOURCE_SRC_RESOURCE_INCLUDE_RESOURCE_AMOUNT_HPP_ */
